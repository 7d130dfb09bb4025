#include <catch2/catch_test_macros.hpp>

#include <pve_session/auth/session_tokens.hpp>

#include <chrono>
#include <string>

using namespace pve_session;
using namespace std::chrono_literals;

namespace {

constexpr const char* kValidTicket =
    "PVE:root@pam:4EEC61E2::rsKoApxDTLYPn6H3NNT6iP2mv/kFJ+SGh0ylV3/4aK8=";
constexpr const char* kValidCsrf = "4EEC61E2:lwk7od06fa1+DcPUwBTXCcndyAY";

} // anonymous namespace

// ===========================================================================
// Ticket::Create
// ===========================================================================

TEST_CASE("Ticket: accepts a well-formed ticket", "[auth][tokens]") {
    auto t = Ticket::Create(kValidTicket);
    REQUIRE(t.IsOk());
    CHECK(t.Value().Value() == kValidTicket);
}

TEST_CASE("Ticket: accepts the short form used in login responses", "[auth][tokens]") {
    CHECK(Ticket::Create("PVE:u@pam:4EEC61E2::sig").IsOk());
}

TEST_CASE("Ticket: rejects malformed values", "[auth][tokens]") {
    const char* bad[] = {
        "",                                   // empty
        "PVE:root@pam:4EEC61E2",              // too few parts
        "PMG:root@pam:4EEC61E2::sig",         // wrong prefix
        "PVE:rootpam:4EEC61E2::sig",          // no '@'
        "PVE:root@@pam:4EEC61E2::sig",        // two '@'
        "PVE:@pam:4EEC61E2::sig",             // empty user
        "PVE:root@:4EEC61E2::sig",            // empty realm
        "PVE:ro ot@pam:4EEC61E2::sig",        // whitespace in user
        "PVE:root@pam:XYZ::sig",              // non-hex ID
        "PVE:root@pam::x:sig",                // empty ID
        "PVE:root@pam:4EEC61E2:x:sig",        // missing '::'
        "PVE:root@pam:4EEC61E2::",            // empty signature
        "PVE:root@pam:4EEC61E2::sig$!",       // non-base64 signature
    };
    for (const char* value : bad) {
        INFO("ticket: " << value);
        auto t = Ticket::Create(value);
        REQUIRE(t.IsErr());
        CHECK(t.Error().category == ErrorCategory::Validation);
        CHECK(t.Error().operation == "Ticket");
    }
}

TEST_CASE("Ticket: rejects values longer than 4096 characters", "[auth][tokens]") {
    std::string value = "PVE:root@pam:4EEC61E2::" + std::string(4100, 'A');
    auto t = Ticket::Create(value);
    REQUIRE(t.IsErr());
    CHECK(t.Error().message.find("4096") != std::string::npos);
}

TEST_CASE("Ticket: cookie header", "[auth][tokens]") {
    auto t = Ticket::Create("PVE:u@pam:4EEC61E2::sig").Value();
    CHECK(t.AsCookieHeader() == "PVEAuthCookie=PVE:u@pam:4EEC61E2::sig");
}

TEST_CASE("Ticket: equality compares values", "[auth][tokens]") {
    auto a = Ticket::Create("PVE:u@pam:4EEC61E2::sig").Value();
    auto b = Ticket::Create("PVE:u@pam:4EEC61E2::sig", Clock::now() - 10s).Value();
    auto c = Ticket::Create("PVE:u@pam:4EEC61E2::other").Value();
    CHECK(a == b);
    CHECK(a != c);
}

// ===========================================================================
// Expiry
// ===========================================================================

TEST_CASE("Ticket: fresh ticket is not expired", "[auth][tokens][expiry]") {
    auto t = Ticket::Create(kValidTicket).Value();
    CHECK_FALSE(t.IsExpired(7200s));
}

TEST_CASE("Ticket: ticket older than its lifetime is expired", "[auth][tokens][expiry]") {
    auto t = Ticket::Create(kValidTicket, Clock::now() - 7201s).Value();
    CHECK(t.IsExpired(7200s));
    CHECK_FALSE(t.IsExpired(8000s));
}

TEST_CASE("Ticket: future creation time counts as expired", "[auth][tokens][expiry]") {
    auto t = Ticket::Create(kValidTicket, Clock::now() + 60s).Value();
    CHECK(t.IsExpired(7200s));
}

TEST_CASE("IsPastLifetime: boundary is exclusive", "[auth][tokens][expiry]") {
    const auto created = Clock::now();
    CHECK_FALSE(IsPastLifetime(created, 300s, created + 300s));
    CHECK(IsPastLifetime(created, 300s, created + 301s));
    CHECK(IsPastLifetime(created, 300s, created - 1s));
}

// ===========================================================================
// CsrfToken
// ===========================================================================

TEST_CASE("CsrfToken: accepts a well-formed token", "[auth][tokens]") {
    auto c = CsrfToken::Create(kValidCsrf);
    REQUIRE(c.IsOk());
    CHECK(c.Value().Value() == kValidCsrf);
    CHECK(CsrfToken::Create("4EEC61E2:abc==").IsOk());
}

TEST_CASE("CsrfToken: rejects malformed values", "[auth][tokens]") {
    const char* bad[] = {
        "",                       // empty
        "4EEC61E2",               // no value
        "4EEC61E2:abc:def",       // three parts
        "4EEC61E:abc",            // 7-digit ID
        "4EEC61E2A:abc",          // 9-digit ID
        "GGGGGGGG:abc",           // non-hex ID
        "4EEC61E2:",              // empty value
        "4EEC61E2:abc_def",       // non-base64 value
    };
    for (const char* value : bad) {
        INFO("csrf: " << value);
        auto c = CsrfToken::Create(value);
        REQUIRE(c.IsErr());
        CHECK(c.Error().category == ErrorCategory::Validation);
        CHECK(c.Error().operation == "CsrfToken");
    }
}

TEST_CASE("CsrfToken: rejects values longer than 1024 characters", "[auth][tokens]") {
    auto c = CsrfToken::Create("4EEC61E2:" + std::string(1100, 'a'));
    CHECK(c.IsErr());
}

TEST_CASE("CsrfToken: header rendering", "[auth][tokens]") {
    auto c = CsrfToken::Create("4EEC61E2:abc==").Value();
    CHECK(c.AsHeader() == "CSRFPreventionToken: 4EEC61E2:abc==");
}

TEST_CASE("CsrfToken: expiry follows its own lifetime", "[auth][tokens][expiry]") {
    auto fresh = CsrfToken::Create(kValidCsrf).Value();
    CHECK_FALSE(fresh.IsExpired(300s));

    auto old = CsrfToken::Create(kValidCsrf, Clock::now() - 301s).Value();
    CHECK(old.IsExpired(300s));
}
