#include "csrfguard/fake-app.hpp"

#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "csrfguard/app-hooks.hpp"
#include "csrfguard/http-constants.hpp"
#include "csrfguard/http-method.hpp"
#include "csrfguard/http-request.hpp"
#include "csrfguard/http-response.hpp"
#include "csrfguard/http-status-code.hpp"
#include "csrfguard/middleware.hpp"
#include "csrfguard/param-list.hpp"
#include "csrfguard/request-scope.hpp"
#include "csrfguard/string-trim.hpp"
#include "csrfguard/vector.hpp"

namespace csrfguard::test {

namespace {

// "/dataset/edit/abc" -> controller "dataset", action "edit"
ActionCall ResolveAction(std::string_view path) {
  ActionCall call;
  path.remove_prefix(path.starts_with('/') ? 1U : 0U);
  auto slashPos = path.find('/');
  call.controller.assign(path.substr(0, slashPos));
  if (slashPos != std::string_view::npos) {
    std::string_view rest = path.substr(slashPos + 1U);
    auto nextSlash = rest.find('/');
    call.action.assign(rest.substr(0, nextSlash));
    if (nextSlash != std::string_view::npos) {
      call.params.append("id", rest.substr(nextSlash + 1U));
    }
  }
  if (call.action.empty()) {
    call.action = "index";
  }
  return call;
}

}  // namespace

FakeApp::FakeApp() {
  _hooks.render = [this](RequestScope&, std::string_view templateName, const RenderOptions& options) {
    return renderTemplate(templateName, options.extraVars);
  };
  _hooks.renderJinja2 = [this](RequestScope&, std::string_view templateName, const TemplateVars& extraVars) {
    return renderTemplate(templateName, extraVars);
  };
  _hooks.beforeAction = [this](RequestScope&, const ActionCall&) {
    ++_nbOriginalBeforeAction;
    return MiddlewareResult::Continue();
  };
}

void FakeApp::addTemplate(std::string name, std::string html) { _templates.insert_or_assign(std::move(name), std::move(html)); }

void FakeApp::addAction(std::string path, Action action) { _actions.insert_or_assign(std::move(path), std::move(action)); }

HttpResponse FakeApp::serve(HttpRequest& request) {
  HttpResponse response;
  RequestScope scope(request, response);
  const ActionCall call = ResolveAction(request.path());

  MiddlewareResult result = _hooks.beforeAction(scope, call);
  if (result.shouldShortCircuit()) {
    return std::move(result).takeResponse();
  }

  auto it = _actions.find(request.path());
  if (it == _actions.end()) {
    return HttpResponse(http::StatusCodeNotFound, "Not Found").body("Not Found");
  }

  ++_nbDispatched;
  _lastFormParams = request.formParams();
  _lastQueryParams = request.queryParams();
  std::string html = it->second(*this, scope, call);
  response.body(std::move(html), http::ContentTypeTextHtml);
  return response;
}

std::string FakeApp::render(RequestScope& scope, std::string_view templateName, TemplateVars extraVars) {
  RenderOptions options;
  options.extraVars = std::move(extraVars);
  return _hooks.render(scope, templateName, options);
}

std::string FakeApp::renderJinja2(RequestScope& scope, std::string_view templateName, const TemplateVars& extraVars) {
  return _hooks.renderJinja2(scope, templateName, extraVars);
}

FakeApp::Action FakeApp::RenderTemplate(std::string templateName) {
  return [templateName = std::move(templateName)](FakeApp& app, RequestScope& scope, const ActionCall&) {
    return app.render(scope, templateName);
  };
}

FakeApp::Action FakeApp::RenderFragments(std::initializer_list<std::string_view> templateNames) {
  vector<std::string> names;
  for (std::string_view name : templateNames) {
    names.emplace_back(name);
  }
  return [names = std::move(names)](FakeApp& app, RequestScope& scope, const ActionCall&) {
    std::string page;
    for (const std::string& name : names) {
      page.append(app.renderJinja2(scope, name));
    }
    return page;
  };
}

std::string FakeApp::renderTemplate(std::string_view templateName, const TemplateVars& extraVars) const {
  auto it = _templates.find(templateName);
  if (it == _templates.end()) {
    throw std::invalid_argument("Unknown template " + std::string(templateName));
  }
  std::string html = it->second;
  for (const auto& [name, value] : extraVars) {
    const std::string placeholder = "{{" + name + "}}";
    for (auto pos = html.find(placeholder); pos != std::string::npos; pos = html.find(placeholder, pos + value.size())) {
      html.replace(pos, placeholder.size(), value);
    }
  }
  return html;
}

HttpRequest MakeRequest(http::Method method, std::string_view target, std::string_view cookieHeader,
                        std::string_view formBody) {
  HttpRequest request(method, target);
  if (!cookieHeader.empty()) {
    request.addHeader(http::Cookie, cookieHeader);
  }
  if (!formBody.empty()) {
    request.body(std::string(formBody));
  }
  return request;
}

std::optional<std::string> SetCookieValue(const HttpResponse& response, std::string_view name) {
  for (std::string_view headerValue : response.headerValues(http::SetCookie)) {
    std::string_view pair = headerValue.substr(0, headerValue.find(';'));
    auto eqPos = pair.find('=');
    if (eqPos != std::string_view::npos && TrimOws(pair.substr(0, eqPos)) == name) {
      return std::string(TrimOws(pair.substr(eqPos + 1U)));
    }
  }
  return std::nullopt;
}

int NbSetCookies(const HttpResponse& response, std::string_view name) {
  int nbCookies = 0;
  for (std::string_view headerValue : response.headerValues(http::SetCookie)) {
    std::string_view cookieName = TrimOws(headerValue.substr(0, headerValue.find('=')));
    if (cookieName == name) {
      ++nbCookies;
    }
  }
  return nbCookies;
}

}  // namespace csrfguard::test
