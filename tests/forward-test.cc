#include <outcome-core/result.hh>

#include <nexus/test.hh>

#include "check-violation.hh"
#include "test-errors.hh"

#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

using transport_errors = oc::error_set<test::unauthorized, test::validation_error>;
using login_errors = oc::error_set<test::invalid_credentials, test::email_not_confirmed>;
using profile_errors = oc::error_set<test::invalid_form_field>;

namespace
{
struct response
{
    int status = 200;
    std::string body;
};

struct auth_token
{
    std::string value;
};

using login_result = oc::result<auth_token, login_errors>;

// error carrying a move-only payload
struct session_expired
{
    std::unique_ptr<std::string> detail;
};

struct session_lost
{
    std::unique_ptr<std::string> detail;
};

struct copy_failed
{
};

// copies throw once armed; no noexcept move, so a failed copy-assignment leaves a variant valueless
struct fragile_value
{
    bool armed = false;

    fragile_value() = default;
    explicit fragile_value(bool a) : armed(a) {}
    fragile_value(fragile_value const& rhs) : armed(rhs.armed)
    {
        if (rhs.armed)
            throw copy_failed{};
    }
    fragile_value& operator=(fragile_value const&) = default;
};

using fragile_result = oc::result<fragile_value, oc::error_set<test::failure1>>;

// a result whose storage lost both value and errors
fragile_result make_malformed()
{
    auto const armed = fragile_result::from_value(true);
    auto res = oc::failure<fragile_value, test::failure1>(test::failure1{"replaced"});
    try
    {
        res = armed;
    }
    catch (copy_failed const&) // NOLINT(bugprone-empty-catch)
    {
    }
    return res;
}

auth_token parse_token(response const& r)
{
    return auth_token{r.body};
}

// the login layer: transport errors become login errors
// a validation error other than the email check is not part of the login contract
auto const remap_login_error = oc::overloaded{
    [](test::unauthorized) -> std::variant<test::invalid_credentials, test::validation_error>
    { return test::invalid_credentials{}; },
    [](test::validation_error const& e) -> std::variant<test::invalid_credentials, test::validation_error>
    {
        if (e.code == "email-not-confirmed")
            return test::invalid_credentials{};
        return e;
    },
};

login_result login(oc::result<response, transport_errors> const& transport)
{
    return transport.forward<auth_token, login_errors>(parse_token, remap_login_error);
}
} // namespace

TEST("forward - success goes through the success callback")
{
    auto const res = oc::success<response, transport_errors>(response{200, "token-123"});

    SECTION("with both callbacks")
    {
        auto const fwd = login(res);
        REQUIRE(fwd.is_successful());
        CHECK(fwd.value().value == "token-123");
    }

    SECTION("failure callback is never called")
    {
        int failure_calls = 0;
        auto const fwd = res.forward<int, login_errors>(
            [](response const& r) { return r.status; },
            [&](auto const&)
            {
                ++failure_calls;
                return test::invalid_credentials{};
            });

        CHECK(fwd.value() == 200);
        CHECK(failure_calls == 0);
    }

    SECTION("failure callback omitted")
    {
        auto const fwd = res.forward<int, login_errors>([](response const& r) { return r.status + 1; });
        CHECK(fwd.value() == 201);
    }

    SECTION("new error set spelled as types")
    {
        auto const fwd = res.forward<int, test::invalid_credentials, test::email_not_confirmed>([](response const&) { return 1; });
        static_assert(std::is_same_v<decltype(fwd), oc::result<int, login_errors> const>);
        CHECK(fwd.value() == 1);
    }
}

TEST("forward - unauthorized becomes invalid credentials")
{
    auto const transport = oc::failure<response, transport_errors>(test::unauthorized{});

    CHECK(transport.has_error<test::unauthorized>());
    CHECK(!transport.has_error<test::validation_error>());

    auto const fwd = login(transport);

    REQUIRE(fwd.is_failed());
    CHECK(fwd.has_single_error<test::invalid_credentials>());
    CHECK(!fwd.has_error<test::email_not_confirmed>());
}

TEST("forward - email check becomes a login error")
{
    auto const transport = oc::failure<response, transport_errors>(
        test::validation_error{"email-not-confirmed", "someone@example.com", "email address is not confirmed"});

    auto const fwd = transport.forward<auth_token, login_errors>(
        parse_token,
        oc::overloaded{
            [](test::unauthorized) -> login_errors::value_type { return test::invalid_credentials{}; },
            [](test::validation_error const& e) -> login_errors::value_type
            {
                if (e.code == "email-not-confirmed")
                    return test::email_not_confirmed{};
                return test::invalid_credentials{};
            },
        });

    CHECK(fwd.has_single_error<test::email_not_confirmed>());
}

TEST("forward - every error is mapped in order")
{
    auto const source = oc::failures<int, test::failure1, test::failure2>({
        test::failure1{"a"},
        test::failure2{"b"},
        test::failure1{"c"},
    });

    std::vector<std::string> seen;
    auto const fwd = source.forward<int, test::failure2, test::failure1>(
        oc::omitted,
        oc::overloaded{
            [&](test::failure1 const& e)
            {
                seen.push_back(e.message);
                return test::failure2{e.message};
            },
            [&](test::failure2 const& e)
            {
                seen.push_back(e.message);
                return test::failure1{e.message};
            },
        });

    REQUIRE(seen.size() == 3);
    CHECK(seen[0] == "a");
    CHECK(seen[1] == "b");
    CHECK(seen[2] == "c");

    REQUIRE(fwd.error_count() == 3);
    CHECK(std::get<test::failure2>(fwd.errors()[0]).message == "a");
    CHECK(std::get<test::failure1>(fwd.errors()[1]).message == "b");
    CHECK(std::get<test::failure2>(fwd.errors()[2]).message == "c");
}

TEST("forward - identity on a shared error type")
{
    // lower layer and upper layer both declare validation_error
    auto const source = oc::failures<int, transport_errors>({test::validation_error{"x", "1", "m"}, test::unauthorized{}});

    auto const fwd = source.forward<std::string, test::validation_error, test::invalid_credentials>(
        [](int v) { return std::to_string(v); },
        oc::overloaded{
            [](test::validation_error const& e) { return e; },
            [](test::unauthorized) { return test::invalid_credentials{}; },
        });

    REQUIRE(fwd.error_count() == 2);
    CHECK(fwd.find_error<test::validation_error>()->code == "x");
    CHECK(fwd.has_error<test::invalid_credentials>());
}

TEST("forward - form errors into a profile result")
{
    // every backend validation error is reported against its form field
    auto const source = oc::failures<response, transport_errors>({
        test::validation_error{"too-short", "ab", "at least 3 characters"},
        test::validation_error{"invalid-email", "nope", "not an email address"},
    });

    auto const fwd = source.forward<bool, profile_errors>(
        [](response const&) { return true; },
        oc::overloaded{
            [](test::unauthorized) { return test::invalid_form_field{"session", "signed out"}; },
            [](test::validation_error const& e) { return test::invalid_form_field{e.incorrect_value, e.message}; },
        });

    auto const fields = fwd.find_errors<test::invalid_form_field>();
    REQUIRE(fields.size() == 2);
    CHECK(fields[0].field_name == "ab");
    CHECK(fields[1].field_name == "nope");
    CHECK(fields[1].message == "not an email address");
}

TEST("forward - missing callbacks are contract violations")
{
    auto const ok = oc::success<int, transport_errors>(1);
    auto const err = oc::failure<int, transport_errors>(test::unauthorized{});

    auto const to_login = [](auto const&) { return test::invalid_credentials{}; };
    auto const to_value = [](int v) { return v; };

    SECTION("both omitted")
    {
        CHECK_VIOLATES(ok.forward<int, login_errors>());
        CHECK_VIOLATES(err.forward<int, login_errors>());
        CHECK_VIOLATES(ok.forward<int, login_errors>(oc::omitted, oc::omitted));
    }

    SECTION("success without success callback")
    {
        auto const v = test::capture_violation([&] { (void)ok.forward<int, login_errors>(oc::omitted, to_login); });
        REQUIRE(v.has_value());
        CHECK(v->message.find("success callback") != std::string::npos);
    }

    SECTION("failure without failure callback")
    {
        auto const v = test::capture_violation([&] { (void)err.forward<int, login_errors>(to_value); });
        REQUIRE(v.has_value());
        CHECK(v->message.find("failure callback") != std::string::npos);
    }

    SECTION("present callbacks are fine")
    {
        CHECK_NO_VIOLATION(ok.forward<int, login_errors>(to_value));
        CHECK_NO_VIOLATION(err.forward<int, login_errors>(oc::omitted, to_login));
    }
}

TEST("forward - null function objects count as omitted")
{
    using single_errors = oc::error_set<test::unauthorized>;
    auto const ok = oc::success<int, single_errors>(1);
    auto const err = oc::failure<int, single_errors>(test::unauthorized{});

    SECTION("empty std::function")
    {
        auto const no_success = std::function<int(int const&)>();
        auto const no_failure = std::function<test::invalid_credentials(test::unauthorized const&)>();
        auto const to_login = std::function<test::invalid_credentials(test::unauthorized const&)>(
            [](test::unauthorized const&) { return test::invalid_credentials{}; });

        CHECK_VIOLATES(ok.forward<int, login_errors>(no_success, no_failure));
        CHECK_VIOLATES(ok.forward<int, login_errors>(no_success, to_login));
        CHECK_VIOLATES(err.forward<int, login_errors>([](int v) { return v; }, no_failure));

        auto const fwd = err.forward<int, login_errors>(no_success, to_login);
        CHECK(fwd.has_single_error<test::invalid_credentials>());
    }

    SECTION("null function pointer")
    {
        int (*no_success)(int const&) = nullptr;
        CHECK_VIOLATES(ok.forward<int, login_errors>(no_success));
    }
}

TEST("forward - leaked errors are contract violations")
{
    SECTION("undeclared alternative returned by the remap")
    {
        // a validation error that is not the email check passes through unchanged and leaks
        auto const transport = oc::failure<response, transport_errors>(test::validation_error{"too-short", "ab", "m"});

        auto const v = test::capture_violation([&] { (void)login(transport); });
        REQUIRE(v.has_value());
        CHECK(v->message.find("cannot forward unexpected errors") != std::string::npos);
#ifdef OC_HAS_RTTI
        CHECK(v->message.find("validation_error") != std::string::npos);
        CHECK(v->message.find("invalid_credentials") != std::string::npos);
        CHECK(v->message.find("email_not_confirmed") != std::string::npos);
#endif
    }

    SECTION("all leaked errors are reported after mapping every error")
    {
        auto const source = oc::failures<int, test::failure1, test::failure2>({test::failure1{"p"}, test::failure2{"q"}});

        int calls = 0;
        auto const v = test::capture_violation(
            [&]
            {
                (void)source.forward<int, login_errors>(oc::omitted,
                                                        [&](auto const& e)
                                                        {
                                                            ++calls;
                                                            return test::unspecified_failure{e.message};
                                                        });
            });

        REQUIRE(v.has_value());
        CHECK(calls == 2);
        CHECK(v->message.find("[unspecified_failure(p), unspecified_failure(q)]") != std::string::npos);
    }

    SECTION("one leaked error fails the whole forward")
    {
        auto const source = oc::failures<int, transport_errors>({test::unauthorized{}, test::validation_error{}});

        CHECK_VIOLATES(source.forward<int, login_errors>(oc::omitted,
                                                         oc::overloaded{
                                                             [](test::unauthorized) { return test::invalid_credentials{}; },
                                                             [](test::validation_error const& e) { return e; },
                                                         }));
    }
}

TEST("forward - rvalue results move value and errors into the callbacks")
{
    SECTION("move-only success value")
    {
        auto res = oc::success<std::unique_ptr<int>, test::failure1>(std::make_unique<int>(5));

        auto const fwd = std::move(res).forward<std::unique_ptr<int>, test::failure2>(
            [](std::unique_ptr<int> p)
            {
                *p += 1;
                return p;
            },
            [](test::failure1 e) { return test::failure2{e.message}; });

        REQUIRE(fwd.is_successful());
        REQUIRE(fwd.value() != nullptr);
        CHECK(*fwd.value() == 6);
    }

    SECTION("move-only errors")
    {
        auto res = oc::failure<int, session_expired>(session_expired{std::make_unique<std::string>("token timed out")});

        auto const fwd = std::move(res).forward<int, session_lost>(oc::omitted, [](session_expired e)
                                                                   { return session_lost{std::move(e.detail)}; });

        REQUIRE(fwd.error_count() == 1);
        auto const& lost = std::get<session_lost>(fwd.errors()[0]);
        REQUIRE(lost.detail != nullptr);
        CHECK(*lost.detail == "token timed out");
    }

    SECTION("prvalue source")
    {
        auto const fwd = oc::success<std::string, test::failure1>("moved").forward<std::string, test::failure2>(
            [](std::string&& s) { return std::move(s) + "!"; });
        CHECK(fwd.value() == "moved!");
    }
}

TEST("forward - malformed source is a contract violation")
{
    auto const malformed = make_malformed();

    CHECK(!malformed.is_successful());
    CHECK(!malformed.is_failed());
    CHECK(malformed.errors().empty());
    CHECK(malformed.to_string() == "<malformed result>");

    SECTION("forward")
    {
        auto const v = test::capture_violation(
            [&]
            {
                (void)malformed.forward<int, test::failure2>([](fragile_value const&) { return 1; },
                                                             [](test::failure1 const& e) { return test::failure2{e.message}; });
            });
        REQUIRE(v.has_value());
        CHECK(v->message.find("malformed") != std::string::npos);
    }

    SECTION("map")
    {
        CHECK_VIOLATES(malformed.map([](fragile_value const&) { return 1; }));
    }

    SECTION("value")
    {
        CHECK_VIOLATES(malformed.value());
    }
}
