#include <csrfguard/csrfguard.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

using namespace csrfguard;

namespace {

constexpr std::string_view kPage =
    "<form method=\"post\" action=\"/dataset/new\">\n"
    "  <input type=\"text\" name=\"title\"/>\n"
    "</form>\n"
    "<a href=\"/dataset/delete/demo\" data-module=\"confirm-action\">Delete</a>\n";

// Plays one request through the hooks, as the framework would do.
HttpResponse Serve(AppHooks& hooks, HttpRequest& request) {
  HttpResponse response;
  RequestScope scope(request, response);
  MiddlewareResult result = hooks.beforeAction(scope, ActionCall{"dataset", "new", {}});
  if (result.shouldShortCircuit()) {
    return std::move(result).takeResponse();
  }
  response.body(hooks.render(scope, "package/new.html", RenderOptions{}), http::ContentTypeTextHtml);
  return response;
}

void Print(std::string_view title, const HttpResponse& response) {
  std::cout << "=== " << title << ": " << response.status() << ' ' << response.reason() << '\n';
  for (const auto& [name, value] : response.headers()) {
    std::cout << name << ": " << value << '\n';
  }
  std::cout << '\n' << response.body() << '\n';
}

}  // namespace

int main() {
  AppHooks hooks;
  hooks.render = [](RequestScope&, std::string_view, const RenderOptions&) { return std::string(kPage); };
  hooks.renderJinja2 = [](RequestScope&, std::string_view, const TemplateVars&) { return std::string(kPage); };
  hooks.beforeAction = [](RequestScope&, const ActionCall&) { return MiddlewareResult::Continue(); };

  try {
    InstallCsrfProtection(hooks);

    // logged in user fetches the form: token embedded and cookie issued
    HttpRequest get(http::Method::GET, "/dataset/new");
    get.addHeader(http::Cookie, "auth_tkt=demo");
    HttpResponse page = Serve(hooks, get);
    Print("GET /dataset/new", page);

    std::string setCookie(page.headerValueOrEmpty(http::SetCookie));
    std::string token = setCookie.substr(setCookie.find('=') + 1U, setCookie.find(';') - setCookie.find('=') - 1U);

    HttpRequest post(http::Method::POST, "/dataset/new");
    post.addHeader(http::Cookie, "auth_tkt=demo; token=" + token);
    post.body("title=demo&token=" + token);
    Print("POST /dataset/new with token", Serve(hooks, post));

    HttpRequest forged(http::Method::POST, "/dataset/new");
    forged.addHeader(http::Cookie, "auth_tkt=demo; token=" + token);
    forged.body("title=pwned");
    Print("POST /dataset/new without token", Serve(hooks, forged));
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
