#include "csrfguard/csrf-filter.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "csrfguard/app-hooks.hpp"
#include "csrfguard/csrf-config.hpp"
#include "csrfguard/csrf-error.hpp"
#include "csrfguard/http-constants.hpp"
#include "csrfguard/http-method.hpp"
#include "csrfguard/http-request.hpp"
#include "csrfguard/http-response.hpp"
#include "csrfguard/http-status-code.hpp"
#include "csrfguard/middleware.hpp"
#include "csrfguard/request-scope.hpp"

namespace csrfguard {

namespace {

constexpr std::string_view kFreshToken = "0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef";
constexpr std::string_view kFormPage = "<form method=\"post\" action=\"/dataset/new\">\n<input name=\"title\"/></form>";

std::string HiddenField(std::string_view token) {
  return std::string(R"(<input type="hidden" name="token" value=")").append(token).append(R"("/>)");
}

class CsrfFilterTest : public ::testing::Test {
 protected:
  CsrfFilterTest() {
    originals.render = [this](RequestScope&, std::string_view templateName, const RenderOptions& options) {
      lastTemplate = templateName;
      lastOptions = options;
      return page;
    };
    originals.renderJinja2 = [this](RequestScope&, std::string_view templateName, const TemplateVars& extraVars) {
      lastTemplate = templateName;
      lastOptions.extraVars = extraVars;
      return page;
    };
    originals.beforeAction = [this](RequestScope&, const ActionCall& call) {
      ++nbOriginalBefore;
      lastAction = call.action;
      return originalBeforeResult;
    };
  }

  CsrfFilter& filter() {
    if (_filter == nullptr) {
      _filter = std::make_unique<CsrfFilter>(config, originals, AuthenticationProbe{}, [this](std::size_t) {
        ++nbGenerated;
        return std::string(kFreshToken);
      });
    }
    return *_filter;
  }

  void setRequest(http::Method method, std::string_view target, std::string_view cookieHeader,
                  std::string_view formBody = {}) {
    request = HttpRequest(method, target);
    if (!cookieHeader.empty()) {
      request.addHeader(http::Cookie, cookieHeader);
    }
    if (!formBody.empty()) {
      request.body(std::string(formBody));
    }
  }

  CsrfConfig config;
  AppHooks originals;
  std::string page{kFormPage};
  std::string lastTemplate;
  RenderOptions lastOptions;
  std::string lastAction;
  MiddlewareResult originalBeforeResult;
  int nbOriginalBefore{};
  int nbGenerated{};
  HttpRequest request{http::Method::GET, "/dataset/new"};
  HttpResponse response;
  RequestScope scope{request, response};

 private:
  std::unique_ptr<CsrfFilter> _filter;
};

}  // namespace

TEST_F(CsrfFilterTest, RejectsEmptyOriginalHooks) {
  originals.renderJinja2 = nullptr;
  EXPECT_THROW(filter(), std::invalid_argument);
}

TEST_F(CsrfFilterTest, RejectsInvalidConfig) {
  config.withTokenFieldName("bad name");
  EXPECT_THROW(filter(), std::invalid_argument);
}

TEST_F(CsrfFilterTest, RenderForwardsToOriginal) {
  setRequest(http::Method::GET, "/dataset/new", "auth_tkt=user1; token=abc123");
  RenderOptions options;
  options.extraVars.emplace("title", "New dataset");
  options.cacheKey = "dataset-new";
  options.method = "html";
  std::string html = filter().render(scope, "package/new.html", options);
  EXPECT_EQ(lastTemplate, "package/new.html");
  EXPECT_EQ(lastOptions.extraVars.at("title"), "New dataset");
  EXPECT_EQ(lastOptions.cacheKey, "dataset-new");
  EXPECT_EQ(lastOptions.method, "html");
  EXPECT_EQ(lastOptions.loaderClass, "MarkupTemplate");
  EXPECT_NE(html.find(HiddenField("abc123")), std::string::npos);
}

TEST_F(CsrfFilterTest, RenderJinja2ForwardsToOriginal) {
  setRequest(http::Method::GET, "/dataset/new", "auth_tkt=user1; token=abc123");
  std::string html = filter().renderJinja2(scope, "package/snippets/form.html", TemplateVars{{"stage", "active"}});
  EXPECT_EQ(lastTemplate, "package/snippets/form.html");
  EXPECT_EQ(lastOptions.extraVars.at("stage"), "active");
  EXPECT_NE(html.find(HiddenField("abc123")), std::string::npos);
}

TEST_F(CsrfFilterTest, UnauthenticatedHtmlIsUntouched) {
  setRequest(http::Method::GET, "/dataset/new", "token=abc123");
  EXPECT_EQ(filter().render(scope, "x", {}), kFormPage);
  EXPECT_FALSE(response.headerValue(http::SetCookie).has_value());
  EXPECT_FALSE(scope.csrf.serverToken.has_value());
}

TEST_F(CsrfFilterTest, HtmlWithoutPostFormIsUntouched) {
  page = "<a data-module=\"confirm-action\" href=\"/dataset/delete/abc\">Delete</a>";
  setRequest(http::Method::GET, "/dataset/abc", "auth_tkt=user1");
  EXPECT_EQ(filter().renderJinja2(scope, "x", {}), page);
  EXPECT_EQ(nbGenerated, 0);
  EXPECT_FALSE(response.headerValue(http::SetCookie).has_value());
}

TEST_F(CsrfFilterTest, IssuesCookieForNewSession) {
  setRequest(http::Method::GET, "/dataset/new", "auth_tkt=user1");
  std::string html = filter().applyToken(scope, page);
  EXPECT_NE(html.find(HiddenField(kFreshToken)), std::string::npos);
  EXPECT_TRUE(scope.csrf.cookieIssued);
  EXPECT_EQ(response.headerValueOrEmpty(http::SetCookie),
            std::string("token=").append(kFreshToken).append("; Max-Age=600; Path=/; HttpOnly"));
}

TEST_F(CsrfFilterTest, ReusesTokenAlreadyEmbedded) {
  setRequest(http::Method::GET, "/dataset/new", "auth_tkt=user1");
  std::string html = std::string("<form method=\"post\">") + HiddenField("c0ffee") + "\n</form>\n" + std::string(kFormPage);
  std::string result = filter().applyToken(scope, html);
  EXPECT_EQ(result, std::string("<form method=\"post\">") + HiddenField("c0ffee") + "\n</form>\n" +
                        "<form method=\"post\" action=\"/dataset/new\">" + HiddenField("c0ffee") +
                        "\n<input name=\"title\"/></form>");
  EXPECT_EQ(nbGenerated, 0);
  EXPECT_FALSE(response.headerValue(http::SetCookie).has_value());
}

TEST_F(CsrfFilterTest, MultipleFragmentsShareToken) {
  setRequest(http::Method::GET, "/dataset/new", "auth_tkt=user1");
  std::string first = filter().renderJinja2(scope, "header.html", {});
  page = "<form method='POST' action='/search'>\n</form>";
  std::string second = filter().render(scope, "body.html", {});
  EXPECT_NE(first.find(HiddenField(kFreshToken)), std::string::npos);
  EXPECT_NE(second.find(HiddenField(kFreshToken)), std::string::npos);
  EXPECT_EQ(nbGenerated, 1);
  EXPECT_EQ(response.headerValues(http::SetCookie).size(), 1U);
}

TEST_F(CsrfFilterTest, BlankServerTokenPropagatesFromRender) {
  setRequest(http::Method::GET, "/dataset/new", "auth_tkt=user1; token=");
  EXPECT_THROW(filter().render(scope, "x", {}), ServerTokenError);
}

TEST_F(CsrfFilterTest, ValidRequestReachesOriginalHook) {
  setRequest(http::Method::POST, "/dataset/new", "auth_tkt=user1; token=abc123", "title=x&token=abc123");
  MiddlewareResult result = filter().beforeAction(scope, ActionCall{"dataset", "new", {}});
  EXPECT_TRUE(result.shouldContinue());
  EXPECT_EQ(nbOriginalBefore, 1);
  EXPECT_EQ(lastAction, "new");
  EXPECT_FALSE(request.formParams().contains("token"));
}

TEST_F(CsrfFilterTest, OriginalHookResultIsReturned) {
  originalBeforeResult = MiddlewareResult::ShortCircuit(
      HttpResponse(http::StatusCodeFound, "Found").header(http::Location, "/user/login"));
  setRequest(http::Method::GET, "/dataset/new", "");
  MiddlewareResult result = filter().beforeAction(scope, ActionCall{"dataset", "new", {}});
  ASSERT_TRUE(result.shouldShortCircuit());
  EXPECT_EQ(result.response().status(), http::StatusCodeFound);
  EXPECT_EQ(result.response().headerValue(http::Location), "/user/login");
}

TEST_F(CsrfFilterTest, InvalidRequestIsAnsweredWith403) {
  setRequest(http::Method::POST, "/dataset/new", "auth_tkt=user1; token=abc123", "title=x&token=evil");
  MiddlewareResult result = filter().beforeAction(scope, ActionCall{"dataset", "new", {}});
  ASSERT_TRUE(result.shouldShortCircuit());
  EXPECT_EQ(nbOriginalBefore, 0);
  const HttpResponse& rejection = result.response();
  EXPECT_EQ(rejection.status(), http::StatusCodeForbidden);
  EXPECT_EQ(rejection.reason(), http::ReasonForbidden);
  EXPECT_EQ(rejection.body(), "Your form submission could not be validated");
  EXPECT_EQ(rejection.headerValue(http::ContentType), http::ContentTypeTextPlain);
}

TEST_F(CsrfFilterTest, AllFailuresLookTheSame) {
  // missing, duplicate, mismatch and blank server token
  for (std::string_view cookies : {"auth_tkt=user1; token=abc123", "auth_tkt=user1; token= "}) {
    for (std::string_view body : {"title=x", "token=abc123&token=abc123", "token=other"}) {
      setRequest(http::Method::POST, "/dataset/new", cookies, body);
      scope.csrf = CsrfRequestContext{};
      MiddlewareResult result = filter().beforeAction(scope, ActionCall{"dataset", "new", {}});
      ASSERT_TRUE(result.shouldShortCircuit());
      EXPECT_EQ(result.response().status(), http::StatusCodeForbidden);
      EXPECT_EQ(result.response().body(), filter().rejectionResponse().body());
    }
  }
  EXPECT_EQ(nbOriginalBefore, 0);
}

TEST_F(CsrfFilterTest, CustomRejectionMessage) {
  config.withRejectionMessage("Please reload the page and try again");
  HttpResponse rejection = filter().rejectionResponse();
  EXPECT_EQ(rejection.status(), http::StatusCodeForbidden);
  EXPECT_EQ(rejection.body(), "Please reload the page and try again");
}

TEST_F(CsrfFilterTest, ExposesComponents) {
  config.withTokenFieldName("_csrf");
  EXPECT_EQ(filter().config().tokenFieldName, "_csrf");
  EXPECT_EQ(filter().htmlRewriter().fieldName(), "_csrf");
  setRequest(http::Method::HEAD, "/", "auth_tkt=user1");
  EXPECT_TRUE(filter().requestValidator().isRequestExempt(scope));
}

}  // namespace csrfguard
