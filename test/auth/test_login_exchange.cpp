#include <catch2/catch_test_macros.hpp>

#include <pve_session/auth/login_exchange.hpp>

#include "mocks/mock_http_transport.hpp"

#include <nlohmann/json.hpp>

using namespace pve_session;
using pve_session::testing::MockHttpTransport;

namespace {

CredentialDescriptor MakeDescriptor() {
    return CredentialDescriptor("pve.example.com", 8006, true, "u", "secret", "pam");
}

constexpr const char* kLoginBody =
    R"({"data":{"ticket":"PVE:u@pam:4EEC61E2::sig","CSRFPreventionToken":"4EEC61E2:abc==","username":"u@pam"}})";

} // anonymous namespace

// ===========================================================================
// Success
// ===========================================================================

TEST_CASE("LoginExchange: 200 yields validated tokens", "[auth][login]") {
    MockHttpTransport mock;
    mock.EnqueuePost(MockHttpTransport::Respond(200, kLoginBody));

    LoginExchange login(mock);
    auto result = login.Execute(MakeDescriptor());

    REQUIRE(result.IsOk());
    const auto& state = result.Value();
    CHECK(state.ticket.Value() == "PVE:u@pam:4EEC61E2::sig");
    REQUIRE(state.csrf_token.has_value());
    CHECK(state.csrf_token->Value() == "4EEC61E2:abc==");
}

TEST_CASE("LoginExchange: request shape", "[auth][login]") {
    MockHttpTransport mock;
    mock.EnqueuePost(MockHttpTransport::Respond(200, kLoginBody));

    LoginExchange login(mock);
    REQUIRE(login.Execute(MakeDescriptor()).IsOk());

    REQUIRE(mock.PostCallCount() == 1);
    const auto call = mock.PostCalls()[0];
    CHECK(call.path == "/api2/json/access/ticket");
    CHECK(call.content_type == "application/json");
    CHECK(call.headers.at("Accept") == "application/json");

    auto body = nlohmann::json::parse(call.body);
    CHECK(body["username"] == "u");
    CHECK(body["password"] == "secret");
    CHECK(body["realm"] == "pam");
}

TEST_CASE("LoginExchange: CSRF token is optional", "[auth][login]") {
    MockHttpTransport mock;
    mock.EnqueuePost(MockHttpTransport::Respond(
        200, R"({"data":{"ticket":"PVE:u@pam:4EEC61E2::sig"}})"));

    LoginExchange login(mock);
    auto result = login.Execute(MakeDescriptor());
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().csrf_token.has_value());
}

// ===========================================================================
// Status mapping
// ===========================================================================

TEST_CASE("LoginExchange: 401 is Authentication", "[auth][login]") {
    MockHttpTransport mock;
    mock.EnqueuePost(MockHttpTransport::Respond(401));

    LoginExchange login(mock);
    auto result = login.Execute(MakeDescriptor());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Authentication);
    CHECK(result.Error().message == "Invalid credentials");
    CHECK(mock.PostCallCount() == 1);
}

TEST_CASE("LoginExchange: 400 is Validation tagged to the ticket path", "[auth][login]") {
    MockHttpTransport mock;
    mock.EnqueuePost(MockHttpTransport::Respond(400));

    LoginExchange login(mock);
    auto result = login.Execute(MakeDescriptor());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Validation);
    CHECK(result.Error().endpoint == "/api2/json/access/ticket");
}

TEST_CASE("LoginExchange: 404, 503 and other statuses are Connection", "[auth][login]") {
    for (int status : {404, 503, 500, 302}) {
        MockHttpTransport mock;
        mock.EnqueuePost(MockHttpTransport::Respond(status));

        LoginExchange login(mock);
        auto result = login.Execute(MakeDescriptor());
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Connection);
        REQUIRE(result.Error().http_status.has_value());
        CHECK(*result.Error().http_status == status);
    }
}

TEST_CASE("LoginExchange: unexpected status carries the code", "[auth][login]") {
    MockHttpTransport mock;
    mock.EnqueuePost(MockHttpTransport::Respond(418));

    LoginExchange login(mock);
    auto result = login.Execute(MakeDescriptor());
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("418") != std::string::npos);
}

TEST_CASE("LoginExchange: transport failure is Connection with cause", "[auth][login]") {
    MockHttpTransport mock;
    mock.EnqueuePost(MockHttpTransport::Fail("Connection refused"));

    LoginExchange login(mock);
    auto result = login.Execute(MakeDescriptor());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Connection);
    CHECK(result.Error().message.find("Connection refused") != std::string::npos);
    CHECK(result.Error().operation == "Login");
}

// ===========================================================================
// Response parsing
// ===========================================================================

TEST_CASE("ParseLoginResponse: malformed bodies are Validation", "[auth][login]") {
    const char* bodies[] = {
        "not json",
        "[]",
        R"({"data":null})",
        R"({"data":{}})",
        R"({"data":{"ticket":42}})",
        R"({"data":{"ticket":"PVE:u@pam:4EEC61E2::sig","CSRFPreventionToken":7}})",
    };
    for (const char* body : bodies) {
        INFO("body: " << body);
        auto result = ParseLoginResponse(body);
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Validation);
    }
}

TEST_CASE("ParseLoginResponse: invalid ticket format is Validation", "[auth][login]") {
    auto result = ParseLoginResponse(R"({"data":{"ticket":"garbage"}})");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Validation);
    CHECK(result.Error().operation == "Login");
    CHECK(result.Error().message.find("Ticket:") == 0);
}

TEST_CASE("ParseLoginResponse: invalid CSRF token is Validation", "[auth][login]") {
    auto result = ParseLoginResponse(
        R"({"data":{"ticket":"PVE:u@pam:4EEC61E2::sig","CSRFPreventionToken":"bad"}})");
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("CsrfToken:") == 0);
}
