#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "csrfguard/middleware.hpp"
#include "csrfguard/param-list.hpp"
#include "csrfguard/request-scope.hpp"

namespace csrfguard {

// Variables handed to a template engine.
using TemplateVars = std::map<std::string, std::string, std::less<>>;

// Options of the markup template renderer.
struct RenderOptions {
  TemplateVars extraVars;
  std::optional<std::string> cacheKey;
  std::optional<std::string> cacheType;
  std::optional<std::chrono::seconds> cacheExpire;
  // Serialization method of the rendered stream.
  std::string method{"xhtml"};
  // Template class used by the loader.
  std::string loaderClass{"MarkupTemplate"};
  bool cacheForce{false};
  // Explicit renderer selection, the application default otherwise.
  std::optional<std::string> renderer;
};

// Controller action about to be dispatched.
struct ActionCall {
  std::string controller;
  std::string action;
  // Routing parameters extracted from the path.
  ParamList params;
};

// Renders a markup template to HTML.
using RenderHook = std::function<std::string(RequestScope&, std::string_view templateName, const RenderOptions&)>;

// Renders a Jinja2 template to HTML.
using Jinja2RenderHook = std::function<std::string(RequestScope&, std::string_view templateName, const TemplateVars&)>;

// Called before each controller action. Returning a short-circuit result skips the action and
// sends the attached response instead.
using BeforeActionHook = std::function<MiddlewareResult(RequestScope&, const ActionCall&)>;

class CsrfFilter;

// Entry points of the application the CSRF filter intercepts.
// Owned by the application, which calls its hooks for every request.
struct AppHooks {
  RenderHook render;
  Jinja2RenderHook renderJinja2;
  BeforeActionHook beforeAction;

  // Filter wrapping the hooks above, set by InstallCsrfProtection.
  std::shared_ptr<const CsrfFilter> csrfFilter;
};

}  // namespace csrfguard
