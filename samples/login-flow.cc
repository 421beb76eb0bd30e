#include <outcome-core/result.hh>

#include <future>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Walks through a small auth stack:
//   transport: post()          -> result<response, {unauthorized, validation_error}>
//   login:     login()         -> result<auth_token, {invalid_credentials, email_not_confirmed}>
//   profile:   edit_profile()  -> result<profile, {unauthorized, invalid_form_field}>
// Each layer re-declares the errors of the layer below with forward().

namespace sample
{
struct unauthorized
{
};

struct validation_error
{
    std::string code;
    std::string incorrect_value;
    std::string message;
};

struct invalid_credentials
{
};

struct email_not_confirmed
{
};

struct invalid_form_field
{
    std::string field_name;
    std::string message;
};

struct response
{
    int status = 0;
    std::map<std::string, std::string> data;
    std::vector<validation_error> errors;
};

struct auth_token
{
    std::string token;
};

struct profile
{
    std::string first_name;
    std::string last_name;
};

using transport_errors = oc::error_set<unauthorized, validation_error>;
using login_errors = oc::error_set<invalid_credentials, email_not_confirmed>;
using profile_errors = oc::error_set<unauthorized, invalid_form_field>;

// canned responses instead of a real HTTP client
struct fake_server
{
    std::map<std::string, response, std::less<>> routes;

    response const& handle(std::string_view path) const
    {
        auto it = routes.find(path);
        OC_ASSERTS_ALWAYS(it != routes.end(), "no canned response for " + std::string(path));
        return it->second;
    }
};

oc::result<response, transport_errors> post(fake_server const& server, std::string_view path)
{
    auto const& r = server.handle(path);

    if (r.status == 200)
        return oc::success<response, transport_errors>(r);

    if (r.status == 401)
        return oc::failure<response, transport_errors>(unauthorized{});

    if (r.status == 400)
        return oc::failures<response, transport_errors>(r.errors);

    // the transport contract only covers the statuses above
    OC_ASSERTS_ALWAYS(false, "unexpected status code " + std::to_string(r.status));
    OC_BUILTIN_UNREACHABLE;
}

oc::async_result<response, transport_errors> post_async(fake_server const& server, std::string_view path)
{
    return std::async(std::launch::deferred, [&server, path] { return post(server, path); });
}

oc::result<auth_token, login_errors> login(fake_server const& server)
{
    return post_async(server, "/auth/login")
        .get()
        .forward<auth_token, login_errors>(
            [](response const& r) { return auth_token{r.data.at("token")}; },
            oc::overloaded{
                [](unauthorized) -> std::variant<invalid_credentials, email_not_confirmed, validation_error>
                { return invalid_credentials{}; },
                [](validation_error const& e) -> std::variant<invalid_credentials, email_not_confirmed, validation_error>
                {
                    if (e.code == "email-not-confirmed")
                        return email_not_confirmed{};
                    return e;
                },
            });
}

oc::result<profile, profile_errors> edit_profile(fake_server const& server)
{
    return post(server, "/profile/edit")
        .forward<profile, profile_errors>(
            [](response const& r) { return profile{r.data.at("firstName"), r.data.at("lastName")}; },
            oc::overloaded{
                [](unauthorized e) -> std::variant<unauthorized, invalid_form_field, validation_error> { return e; },
                [](validation_error const& e) -> std::variant<unauthorized, invalid_form_field, validation_error>
                {
                    if (e.code == "incorrect-value")
                        return invalid_form_field{e.incorrect_value, e.message};
                    return e;
                },
            });
}

void on_login_pressed(fake_server const& server)
{
    auto const res = login(server);

    if (res.has_error<invalid_credentials>())
    {
        std::cout << "login: password or email are incorrect\n";
        return;
    }

    if (res.has_error<email_not_confirmed>())
    {
        std::cout << "login: redirect to confirmation page\n";
        return;
    }

    std::cout << "login: stored token " << res.value().token << '\n';
}

void on_edit_profile_pressed(fake_server const& server)
{
    auto const res = edit_profile(server);

    if (res.has_error<unauthorized>())
    {
        std::cout << "profile: redirect to login page\n";
        return;
    }

    auto const field_errors = res.find_errors<invalid_form_field>();
    for (auto const& e : field_errors)
        std::cout << "profile: field '" << e.field_name << "': " << e.message << '\n';
    if (!field_errors.empty())
        return;

    std::cout << "profile: saved " << res.value().first_name << ' ' << res.value().last_name << '\n';
}
} // namespace sample

int main()
{
    using namespace sample;

    auto ok_server = fake_server{};
    ok_server.routes["/auth/login"] = response{200, {{"token", "t-42"}}, {}};
    ok_server.routes["/profile/edit"] = response{200, {{"firstName", "Ada"}, {"lastName", "Lovelace"}}, {}};

    auto unauthorized_server = fake_server{};
    unauthorized_server.routes["/auth/login"] = response{401, {}, {}};
    unauthorized_server.routes["/profile/edit"] = response{401, {}, {}};

    auto validating_server = fake_server{};
    validating_server.routes["/auth/login"]
        = response{400, {}, {validation_error{"email-not-confirmed", "ada@example.com", "email is not confirmed"}}};
    validating_server.routes["/profile/edit"] = response{400,
                                                         {},
                                                         {
                                                             validation_error{"incorrect-value", "firstName", "must not be empty"},
                                                             validation_error{"incorrect-value", "lastName", "too long"},
                                                         }};

    for (auto const* server : {&ok_server, &unauthorized_server, &validating_server})
    {
        on_login_pressed(*server);
        on_edit_profile_pressed(*server);
    }

    return 0;
}
