#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <pve_session/http/request_dispatcher.hpp>

#include "mocks/mock_http_transport.hpp"

#include <chrono>
#include <string>

using namespace pve_session;
using namespace pve_session::testing;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace {

const CredentialDescriptor kDescriptor("pve.example.com", 8006, true,
                                       "root", "secret", "pam");

std::string LoginBody(const std::string& sig) {
    return R"({"data":{"ticket":"PVE:root@pam:4EEC61E2::)" + sig +
           R"(","CSRFPreventionToken":"4EEC61E2:)" + sig + R"("}})";
}

AuthenticationState MakeState(const std::string& sig,
                              Clock::time_point created = Clock::now(),
                              bool with_csrf = true) {
    auto ticket = Ticket::Create("PVE:root@pam:4EEC61E2::" + sig, created).Value();
    std::optional<CsrfToken> csrf;
    if (with_csrf) {
        csrf = CsrfToken::Create("4EEC61E2:" + sig, created).Value();
    }
    return AuthenticationState{ticket, csrf};
}

// Wires the dispatcher to a mock, the way PveClient wires it to HTTP.
struct Fixture {
    SessionConfig config;
    MockHttpTransport mock;
    SessionStore store;
    LoginExchange login{mock};
    RateLimiter limiter{std::nullopt};
    RefreshCoordinator coordinator{kDescriptor, login, store};
    RequestDispatcher dispatcher{config, mock, store, limiter, coordinator};
};

} // anonymous namespace

// ===========================================================================
// BuildAuthHeaders
// ===========================================================================

TEST_CASE("BuildAuthHeaders: cookie, CSRF and Accept", "[http][dispatch]") {
    auto headers = BuildAuthHeaders(MakeState("abc"));
    CHECK(headers.at("Cookie") == "PVEAuthCookie=PVE:root@pam:4EEC61E2::abc");
    CHECK(headers.at("CSRFPreventionToken") == "4EEC61E2:abc");
    CHECK(headers.at("Accept") == "application/json");
}

TEST_CASE("BuildAuthHeaders: CSRF header omitted without a token", "[http][dispatch]") {
    auto headers = BuildAuthHeaders(MakeState("abc", Clock::now(), false));
    CHECK(headers.count("Cookie") == 1);
    CHECK(headers.count("CSRFPreventionToken") == 0);
}

// ===========================================================================
// Execute
// ===========================================================================

TEST_CASE("Execute: logs in first when the store is empty", "[http][dispatch]") {
    Fixture f;
    f.mock.EnqueuePost(MockHttpTransport::Respond(200, LoginBody("fresh")));
    f.mock.EnqueueGet(MockHttpTransport::Respond(200, R"({"data":{"version":"8.1"}})"));

    auto result = f.dispatcher.Execute(HttpMethod::Get, "version");
    REQUIRE(result.IsOk());
    CHECK(result.Value()["data"]["version"] == "8.1");

    REQUIRE(f.mock.PostCallCount() == 1);
    CHECK(f.mock.PostCalls()[0].path == "/api2/json/access/ticket");

    auto gets = f.mock.GetCalls();
    REQUIRE(gets.size() == 1);
    CHECK(gets[0].path == "/api2/json/version");
    CHECK(gets[0].headers.at("Cookie") == "PVEAuthCookie=PVE:root@pam:4EEC61E2::fresh");
    CHECK(gets[0].headers.at("CSRFPreventionToken") == "4EEC61E2:fresh");
}

TEST_CASE("Execute: reuses a valid session without logging in", "[http][dispatch]") {
    Fixture f;
    f.store.Write(MakeState("cached"));
    f.mock.EnqueueGet(MockHttpTransport::Respond(200, R"({"data":[]})"));

    auto result = f.dispatcher.Execute(HttpMethod::Get, "/nodes");
    REQUIRE(result.IsOk());
    CHECK(f.mock.PostCallCount() == 0);
    CHECK(f.mock.GetCalls()[0].path == "/api2/json/nodes");
}

TEST_CASE("Execute: expired ticket triggers a login", "[http][dispatch]") {
    Fixture f;
    f.store.Write(MakeState("stale", Clock::now() - 3h));
    f.mock.EnqueuePost(MockHttpTransport::Respond(200, LoginBody("fresh")));
    f.mock.EnqueueGet(MockHttpTransport::Respond(200, R"({"data":null})"));

    auto result = f.dispatcher.Execute(HttpMethod::Get, "nodes");
    REQUIRE(result.IsOk());
    CHECK(f.mock.PostCallCount() == 1);
    CHECK(f.mock.GetCalls()[0].headers.at("Cookie") ==
          "PVEAuthCookie=PVE:root@pam:4EEC61E2::fresh");
}

TEST_CASE("Execute: 401 re-authenticates and retries once", "[http][dispatch]") {
    Fixture f;
    f.store.Write(MakeState("old"));
    f.mock.EnqueueGet(MockHttpTransport::Respond(401, "ticket expired"));
    f.mock.EnqueuePost(MockHttpTransport::Respond(200, LoginBody("new")));
    f.mock.EnqueueGet(MockHttpTransport::Respond(200, R"({"data":{"ok":1}})"));

    auto result = f.dispatcher.Execute(HttpMethod::Get, "cluster/status");
    REQUIRE(result.IsOk());
    CHECK(result.Value()["data"]["ok"] == 1);

    auto gets = f.mock.GetCalls();
    REQUIRE(gets.size() == 2);
    CHECK(gets[0].headers.at("Cookie") == "PVEAuthCookie=PVE:root@pam:4EEC61E2::old");
    CHECK(gets[1].headers.at("Cookie") == "PVEAuthCookie=PVE:root@pam:4EEC61E2::new");
    CHECK(gets[1].headers.at("CSRFPreventionToken") == "4EEC61E2:new");

    auto state = f.store.Read();
    REQUIRE(state.has_value());
    CHECK(state->ticket.Value() == "PVE:root@pam:4EEC61E2::new");
}

TEST_CASE("Execute: second 401 is an authentication error", "[http][dispatch]") {
    Fixture f;
    f.store.Write(MakeState("old"));
    f.mock.EnqueueGet(MockHttpTransport::Respond(401));
    f.mock.EnqueuePost(MockHttpTransport::Respond(200, LoginBody("new")));
    f.mock.EnqueueGet(MockHttpTransport::Respond(401));

    auto result = f.dispatcher.Execute(HttpMethod::Get, "nodes");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Authentication);
    CHECK(result.Error().http_status == 401);
    CHECK(f.mock.GetCallCount() == 2);
    CHECK(f.mock.PostCallCount() == 1);
}

TEST_CASE("Execute: failed re-login is returned as is", "[http][dispatch]") {
    Fixture f;
    f.store.Write(MakeState("old"));
    f.mock.EnqueueGet(MockHttpTransport::Respond(401));
    f.mock.EnqueuePost(MockHttpTransport::Respond(401, "authentication failure"));

    auto result = f.dispatcher.Execute(HttpMethod::Get, "nodes");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Authentication);
    CHECK(f.mock.GetCallCount() == 1);
}

TEST_CASE("Execute: POST body and retry on 401", "[http][dispatch]") {
    Fixture f;
    f.store.Write(MakeState("old"));
    f.mock.EnqueuePost(MockHttpTransport::Respond(401));
    f.mock.EnqueuePost(MockHttpTransport::Respond(200, LoginBody("new")));
    f.mock.EnqueuePost(MockHttpTransport::Respond(200, R"({"data":"UPID:pve1:1"})"));

    nlohmann::json body = {{"vmid", 100}};
    auto result = f.dispatcher.Execute(HttpMethod::Post, "nodes/pve1/qemu", body);
    REQUIRE(result.IsOk());
    CHECK(result.Value()["data"] == "UPID:pve1:1");

    auto posts = f.mock.PostCalls();
    REQUIRE(posts.size() == 3);
    CHECK(posts[0].path == "/api2/json/nodes/pve1/qemu");
    CHECK(posts[0].body == R"({"vmid":100})");
    CHECK(posts[0].content_type == "application/json");
    CHECK(posts[1].path == "/api2/json/access/ticket");
    CHECK(posts[2].body == posts[0].body);
}

TEST_CASE("Execute: non-401 error status is a connection error", "[http][dispatch]") {
    Fixture f;
    f.store.Write(MakeState("ok"));
    f.mock.EnqueueGet(MockHttpTransport::Respond(500, "internal failure"));

    auto result = f.dispatcher.Execute(HttpMethod::Get, "nodes");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Connection);
    CHECK(result.Error().http_status == 500);
    CHECK_THAT(result.Error().message, ContainsSubstring("500"));
    CHECK_THAT(result.Error().message, ContainsSubstring("internal failure"));
    CHECK(f.mock.GetCallCount() == 1);
}

TEST_CASE("Execute: invalid JSON body is a connection error", "[http][dispatch]") {
    Fixture f;
    f.store.Write(MakeState("ok"));
    f.mock.EnqueueGet(MockHttpTransport::Respond(200, "<html>not json</html>"));

    auto result = f.dispatcher.Execute(HttpMethod::Get, "nodes");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Connection);
    CHECK_THAT(result.Error().message, ContainsSubstring("Failed to parse response"));
}

TEST_CASE("Execute: empty success body decodes to null", "[http][dispatch]") {
    Fixture f;
    f.store.Write(MakeState("ok"));
    f.mock.EnqueueDelete(MockHttpTransport::Respond(200, ""));

    auto result = f.dispatcher.Execute(HttpMethod::Delete, "pools/test");
    REQUIRE(result.IsOk());
    CHECK(result.Value().is_null());
}

TEST_CASE("Execute: transport failure is a connection error", "[http][dispatch]") {
    Fixture f;
    f.store.Write(MakeState("ok"));
    f.mock.EnqueuePut(MockHttpTransport::Fail("connection reset"));

    auto result = f.dispatcher.Execute(HttpMethod::Put, "nodes/pve1/config",
                                       nlohmann::json{{"description", "x"}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Connection);
    CHECK(result.Error().endpoint == "/api2/json/nodes/pve1/config");
    CHECK(result.Error().operation == "Request PUT");
}

TEST_CASE("EnsureAuthenticated: logs in only when needed", "[http][dispatch]") {
    Fixture f;
    f.mock.EnqueuePost(MockHttpTransport::Respond(200, LoginBody("fresh")));

    REQUIRE(f.dispatcher.EnsureAuthenticated().IsOk());
    REQUIRE(f.dispatcher.EnsureAuthenticated().IsOk());
    CHECK(f.mock.PostCallCount() == 1);
    CHECK(f.store.IsAuthenticated(f.config.ticket_lifetime));
}
