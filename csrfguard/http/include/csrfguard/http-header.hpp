#pragma once

#include <string>

namespace csrfguard::http {

struct Header {
  std::string name;
  std::string value;
};

}  // namespace csrfguard::http
