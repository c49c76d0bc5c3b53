#pragma once

#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "csrfguard/app-hooks.hpp"
#include "csrfguard/http-method.hpp"
#include "csrfguard/http-request.hpp"
#include "csrfguard/http-response.hpp"
#include "csrfguard/param-list.hpp"
#include "csrfguard/request-scope.hpp"

namespace csrfguard::test {

// In-process stand-in for the web framework the filter is installed in.
// Responsibilities:
//  * Own the AppHooks table, initialized with plain (unprotected) renderers and pre-dispatch hook
//  * Route a request path to an action, calling beforeAction first, like the framework dispatch does
//  * Render templates registered in memory, substituting '{{name}}' by the matching extra variable
//
// Usage pattern:
//   FakeApp app;
//   app.addTemplate("form.html", "<form method=\"post\">\n<input name=\"title\"/></form>");
//   app.addAction("/dataset/new", FakeApp::RenderTemplate("form.html"));
//   InstallCsrfProtection(app.hooks());
//   HttpResponse response = app.serve(request);
class FakeApp {
 public:
  // Body of the response of a dispatched action.
  using Action = std::function<std::string(FakeApp&, RequestScope&, const ActionCall&)>;

  FakeApp();

  // Hooks refer to this instance.
  FakeApp(const FakeApp&) = delete;
  FakeApp(FakeApp&&) = delete;
  FakeApp& operator=(const FakeApp&) = delete;
  FakeApp& operator=(FakeApp&&) = delete;

  ~FakeApp() = default;

  AppHooks& hooks() noexcept { return _hooks; }

  void addTemplate(std::string name, std::string html);

  // Registers the action serving exactly 'path'.
  void addAction(std::string path, Action action);

  // Runs the whole pipeline for 'request': beforeAction hook, then the action of its path.
  // Returns the short-circuit response if the pre-dispatch hook stops the request, a 404 if no action
  // serves the path, the HTML rendered by the action otherwise.
  HttpResponse serve(HttpRequest& request);

  // Renders through the (possibly intercepted) markup template hook.
  std::string render(RequestScope& scope, std::string_view templateName, TemplateVars extraVars = {});

  // Renders through the (possibly intercepted) Jinja2 hook.
  std::string renderJinja2(RequestScope& scope, std::string_view templateName, const TemplateVars& extraVars = {});

  // Action rendering a single markup template.
  static Action RenderTemplate(std::string templateName);

  // Action rendering a page made of several Jinja2 fragments, concatenated.
  static Action RenderFragments(std::initializer_list<std::string_view> templateNames);

  // Number of times the original pre-dispatch hook was called.
  [[nodiscard]] int nbOriginalBeforeAction() const noexcept { return _nbOriginalBeforeAction; }

  // Number of dispatched actions.
  [[nodiscard]] int nbDispatched() const noexcept { return _nbDispatched; }

  // Form parameters seen by the last dispatched action.
  [[nodiscard]] const ParamList& lastFormParams() const noexcept { return _lastFormParams; }

  // Query parameters seen by the last dispatched action.
  [[nodiscard]] const ParamList& lastQueryParams() const noexcept { return _lastQueryParams; }

 private:
  [[nodiscard]] std::string renderTemplate(std::string_view templateName, const TemplateVars& extraVars) const;

  std::map<std::string, std::string, std::less<>> _templates;
  std::map<std::string, Action, std::less<>> _actions;
  AppHooks _hooks;
  ParamList _lastFormParams;
  ParamList _lastQueryParams;
  int _nbOriginalBeforeAction{0};
  int _nbDispatched{0};
};

// Builds a request with given cookie header (if not empty) and url-encoded body (if not empty).
HttpRequest MakeRequest(http::Method method, std::string_view target, std::string_view cookieHeader = {},
                        std::string_view formBody = {});

// Value of the cookie 'name' set by 'response', if any.
std::optional<std::string> SetCookieValue(const HttpResponse& response, std::string_view name);

// Number of 'Set-Cookie' headers of 'response' for cookie 'name'.
int NbSetCookies(const HttpResponse& response, std::string_view name);

}  // namespace csrfguard::test
