#include "csrfguard/csrf-installer.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "csrfguard/app-hooks.hpp"
#include "csrfguard/csrf-filter.hpp"
#include "csrfguard/log.hpp"
#include "csrfguard/middleware.hpp"
#include "csrfguard/request-scope.hpp"

namespace csrfguard {

std::shared_ptr<const CsrfFilter> InstallCsrfProtection(AppHooks& hooks, CsrfConfig config,
                                                        AuthenticationProbe isAuthenticated,
                                                        TokenGenerator tokenGenerator) {
  if (hooks.csrfFilter) {
    throw std::logic_error("CSRF protection is already installed on these application hooks");
  }

  auto filter =
      std::make_shared<const CsrfFilter>(std::move(config), hooks, std::move(isAuthenticated), std::move(tokenGenerator));

  hooks.render = [filter](RequestScope& scope, std::string_view templateName, const RenderOptions& options) {
    return filter->render(scope, templateName, options);
  };
  hooks.renderJinja2 = [filter](RequestScope& scope, std::string_view templateName, const TemplateVars& extraVars) {
    return filter->renderJinja2(scope, templateName, extraVars);
  };
  hooks.beforeAction = [filter](RequestScope& scope, const ActionCall& call) {
    return filter->beforeAction(scope, call);
  };
  hooks.csrfFilter = filter;

  const CsrfConfig& installedConfig = filter->config();
  log::info("CSRF protection installed: token field '{}', cookie max age {}s, {} exempt path prefix(es)",
            installedConfig.tokenFieldName, installedConfig.cookieMaxAge.count(),
            installedConfig.exemptPathPrefixes.size());
  return filter;
}

}  // namespace csrfguard
