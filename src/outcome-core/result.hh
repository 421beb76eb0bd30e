#pragma once

#include <outcome-core/assert.hh>
#include <outcome-core/error_set.hh>
#include <outcome-core/fwd.hh>
#include <outcome-core/to_debug_string.hh>
#include <outcome-core/utility.hh>

#include <cstddef>
#include <functional>
#include <future>
#include <initializer_list>
#include <limits>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace oc
{
/// Readable spelling of an omitted forward() callback
/// Usage: res.forward<token, login_errors>(oc::omitted, remap_transport_error);
inline constexpr std::nullptr_t omitted = nullptr;

/// A result delivered asynchronously
/// Only a naming convention: the result itself is a plain, complete value
template <class T, class ErrorSet>
using async_result = std::future<result<T, ErrorSet>>;

namespace impl
{
template <class T>
constexpr bool is_result = false;
template <class T, class ErrorSet>
constexpr bool is_result<result<T, ErrorSet>> = true;

// violation messages list every error, never a truncated prefix
inline constexpr debug_string_config full_error_listing{.max_length = std::numeric_limits<isize>::max()};

// forward() treats nullptr, null function pointers and empty std::function as "not supplied"
template <class F>
[[nodiscard]] constexpr bool is_supplied(F const& f)
{
    if constexpr (std::is_null_pointer_v<F>)
        return false;
    else if constexpr (requires { bool(f == nullptr); })
        return !(f == nullptr);
    else
        return true;
}

// message builders for contract violations, out of line to keep the hot path small
[[nodiscard]] OC_COLD_FUNC std::string describe_unhandled_errors(std::string_view rendered_errors);
[[nodiscard]] OC_COLD_FUNC std::string describe_undeclared_error(std::string_view rendered_error,
                                                                 std::string_view declared_set);
[[nodiscard]] OC_COLD_FUNC std::string describe_undeclared_errors(std::span<std::string const> rendered_errors,
                                                                  std::string_view declared_set);
[[nodiscard]] OC_COLD_FUNC std::string describe_leaked_errors(std::span<std::string const> rendered_errors,
                                                              std::string_view declared_set);
} // namespace impl
} // namespace oc

/// Outcome of an operation: either a success value T, or a non-empty, ordered list of expected errors.
/// The expected errors are closed over ErrorSet: every stored error is one of its declared types.
///
/// Anything that is not a declared error is a programmer bug and goes through the assertion handler
/// (see assert.hh), never through the error list.
///
/// Usage:
///   using transport_errors = oc::error_set<unauthorized, validation_error>;
///
///   oc::result<response, transport_errors> post(std::string_view path)
///   {
///       if (status == 401)
///           return oc::failure<response, transport_errors>(unauthorized{});
///       return oc::success<response, transport_errors>(resp);
///   }
///
///   auto res = post("/auth/login");
///   if (res.has_error<unauthorized>())
///       return redirect_to_login();
///   use(res.value());
///
/// A result is a value: there are no mutating members, map() and forward() create new results.
template <class T, class ErrorSet>
struct oc::result
{
    static_assert(impl::is_error_set<ErrorSet>, "the second parameter of oc::result must be an oc::error_set<...>");
    static_assert(std::is_object_v<T> && !std::is_array_v<T>, "success type must be a non-array object type");
    static_assert(!impl::is_result<T>, "nested results are not supported, use forward() to re-declare errors");

public:
    using value_type = T;
    using error_set_type = ErrorSet;
    /// std::variant over the declared error types
    using error_type = typename ErrorSet::value_type;

    // construction
    // (prefer oc::success, oc::failure and oc::failures, they read better at call sites)
public:
    /// successful result holding T constructed from args
    template <class... Args>
    [[nodiscard]] static result from_value(Args&&... args)
    {
        return result(std::in_place_index<0>, std::forward<Args>(args)...);
    }

    /// failed result holding the given errors
    /// Precondition: errors is not empty
    [[nodiscard]] static result from_errors(std::vector<error_type> errors)
    {
        OC_ASSERT_ALWAYS(!errors.empty(), "a failed result needs at least one error");
        return result(std::in_place_index<1>, std::move(errors));
    }

    // state queries
public:
    [[nodiscard]] bool is_successful() const { return _state.index() == 0; }
    [[nodiscard]] bool is_failed() const { return _state.index() == 1; }

    /// all errors in the order they were reported, empty for successful results
    [[nodiscard]] std::span<error_type const> errors() const
    {
        if (auto const* errs = std::get_if<1>(&_state))
            return *errs;
        return {};
    }

    [[nodiscard]] isize error_count() const { return isize(errors().size()); }

    // error queries
    // V must be one of the declared errors: asking for anything else is a declaration mismatch
public:
    /// first error of type V, nullopt if successful or no such error
    template <class V>
    [[nodiscard]] std::optional<V> find_error() const
    {
        static_assert(ErrorSet::template declares<V>, "V is not declared in the error_set of this result");
        for (auto const& e : errors())
            if (auto const* v = std::get_if<V>(&e))
                return *v;
        return std::nullopt;
    }

    /// all errors of type V in their original order
    template <class V>
    [[nodiscard]] std::vector<V> find_errors() const
    {
        static_assert(ErrorSet::template declares<V>, "V is not declared in the error_set of this result");
        std::vector<V> found;
        for (auto const& e : errors())
            if (auto const* v = std::get_if<V>(&e))
                found.push_back(*v);
        return found;
    }

    /// true if at least one error of type V is present
    template <class V>
    [[nodiscard]] bool has_error() const
    {
        static_assert(ErrorSet::template declares<V>, "V is not declared in the error_set of this result");
        for (auto const& e : errors())
            if (std::holds_alternative<V>(e))
                return true;
        return false;
    }

    /// true if there is exactly one error in total and it is of type V
    /// a second error of any other type makes this false
    template <class V>
    [[nodiscard]] bool has_single_error() const
    {
        static_assert(ErrorSet::template declares<V>, "V is not declared in the error_set of this result");
        auto const errs = errors();
        return errs.size() == 1 && std::holds_alternative<V>(errs.front());
    }

    // value access
public:
    /// the success value
    /// Precondition: is_successful(), otherwise a contract violation listing all errors
    [[nodiscard]] T const& value() const&
    {
        ensure_success();
        return std::get<0>(_state);
    }
    [[nodiscard]] T&& value() &&
    {
        ensure_success();
        return std::get<0>(std::move(_state));
    }

    /// same check as value() without accessing it
    void ensure_success() const
    {
        OC_ASSERTS_ALWAYS(is_successful(),
                          impl::describe_unhandled_errors(oc::to_debug_string(errors(), impl::full_error_listing)));
    }

    // transformation
public:
    /// result<U, ErrorSet> with f applied to the value, errors are passed through untouched
    template <class F>
    [[nodiscard]] auto map(F&& f) const&
    {
        using U = std::remove_cvref_t<std::invoke_result_t<F, T const&>>;
        OC_ASSERT_ALWAYS(is_well_formed(), "cannot map a malformed result (neither value nor errors)");

        if (is_successful())
            return result<U, ErrorSet>::from_value(std::invoke(std::forward<F>(f), std::get<0>(_state)));
        return result<U, ErrorSet>::from_errors(std::get<1>(_state));
    }
    template <class F>
    [[nodiscard]] auto map(F&& f) &&
    {
        using U = std::remove_cvref_t<std::invoke_result_t<F, T&&>>;
        OC_ASSERT_ALWAYS(is_well_formed(), "cannot map a malformed result (neither value nor errors)");

        if (is_successful())
            return result<U, ErrorSet>::from_value(std::invoke(std::forward<F>(f), std::get<0>(std::move(_state))));
        return result<U, ErrorSet>::from_errors(std::get<1>(std::move(_state)));
    }

    /// Re-declares this result over another error set, typically to turn low-level errors into domain errors.
    ///
    /// NewEs is either the new error types or a single error_set<...>.
    /// Both callbacks are optional (pass nullptr / oc::omitted), but the current state needs its callback:
    ///   - successful: Ok(on_success(value)), on_failure is never called
    ///   - failed:     on_failure is called once per error, in order, with the concrete error
    ///                 (not the variant), so overload sets and generic lambdas can pick by type.
    ///                 Each call may return a declared type of the new set or any std::variant.
    ///                 Every returned error must be a member of the new set, otherwise the whole
    ///                 forward is a contract violation naming the leaked errors.
    ///
    /// Usage:
    ///   return post("/auth/login", body).forward<auth_token, login_errors>(
    ///       [](response const& r) { return auth_token::parse(r.body); },
    ///       oc::overloaded{
    ///           [](unauthorized) { return invalid_credentials{}; },
    ///           [](validation_error const& e) -> std::variant<email_not_confirmed, validation_error> {
    ///               if (e.code == "email-not-confirmed")
    ///                   return email_not_confirmed{};
    ///               return e; // not declared by login_errors: fatal if it ever happens
    ///           },
    ///       });
    ///
    /// On an rvalue result the success value and the errors are moved into the callbacks,
    /// so move-only values can be forwarded: std::move(res).forward<U, Set>(...)
    template <class U, class... NewEs, class SuccessF = std::nullptr_t, class FailureF = std::nullptr_t>
    [[nodiscard]] result<U, error_set_of<NewEs...>> forward(SuccessF&& on_success = nullptr,
                                                            FailureF&& on_failure = nullptr) const&
    {
        return forward_impl<U, error_set_of<NewEs...>>(*this, std::forward<SuccessF>(on_success),
                                                       std::forward<FailureF>(on_failure));
    }
    template <class U, class... NewEs, class SuccessF = std::nullptr_t, class FailureF = std::nullptr_t>
    [[nodiscard]] result<U, error_set_of<NewEs...>> forward(SuccessF&& on_success = nullptr,
                                                            FailureF&& on_failure = nullptr) &&
    {
        return forward_impl<U, error_set_of<NewEs...>>(std::move(*this), std::forward<SuccessF>(on_success),
                                                       std::forward<FailureF>(on_failure));
    }

    // diagnostics
public:
    /// "ok(<value>)" or "err([<error>, ...])", picked up by oc::to_debug_string
    [[nodiscard]] std::string to_string() const
    {
        if (is_successful())
            return "ok(" + oc::to_debug_string(std::get<0>(_state)) + ")";
        if (is_failed())
            return "err(" + oc::to_debug_string(errors()) + ")";
        return "<malformed result>";
    }

private:
    // shared by both forward() overloads, Self is result const& or result
    template <class U, class NewSet, class Self, class SuccessF, class FailureF>
    [[nodiscard]] static result<U, NewSet> forward_impl(Self&& self, SuccessF&& on_success, FailureF&& on_failure)
    {
        using target = result<U, NewSet>;
        using success_t = std::remove_cvref_t<SuccessF>;
        using failure_t = std::remove_cvref_t<FailureF>;
        // T const& or T&&
        using value_ref = decltype(std::get<0>(std::declval<Self>()._state));
        constexpr bool move_errors = std::is_rvalue_reference_v<decltype(std::get<1>(std::declval<Self>()._state))>;

        static_assert(std::is_null_pointer_v<success_t> || std::is_invocable_v<SuccessF&, value_ref>,
                      "success callback must be callable with the success value");
        if constexpr (!std::is_null_pointer_v<success_t>)
            static_assert(std::is_constructible_v<U, std::invoke_result_t<SuccessF&, value_ref>>,
                          "success callback must return something U can be constructed from");

        bool const has_success = impl::is_supplied(on_success);
        bool const has_failure = impl::is_supplied(on_failure);

        OC_ASSERT_ALWAYS(has_success || has_failure, "forward needs a success or a failure callback");
        OC_ASSERT_ALWAYS(self.is_well_formed(), "cannot forward a malformed result (neither value nor errors)");

        if (self.is_successful())
        {
            OC_ASSERT_ALWAYS(has_success, "cannot forward a successful result without a success callback");

            if constexpr (std::is_null_pointer_v<success_t>)
                OC_BUILTIN_UNREACHABLE;
            else
                return target::from_value(std::invoke(on_success, std::get<0>(std::forward<Self>(self)._state)));
        }

        OC_ASSERT_ALWAYS(has_failure, "cannot forward a failed result without a failure callback");

        if constexpr (std::is_null_pointer_v<failure_t>)
        {
            OC_BUILTIN_UNREACHABLE;
        }
        else
        {
            auto&& source_errors = std::get<1>(std::forward<Self>(self)._state);

            std::vector<typename target::error_type> forwarded;
            forwarded.reserve(source_errors.size());
            std::vector<std::string> leaked;

            auto forward_error = [&](auto&& alt)
            {
                using mapped_t = std::invoke_result_t<FailureF&, decltype(alt)>;
                static_assert(!std::is_void_v<mapped_t>, "failure callback must return the forwarded error");

                auto mapped = std::invoke(on_failure, std::forward<decltype(alt)>(alt));
                if (NewSet::is_member(mapped))
                    forwarded.push_back(*NewSet::narrow(std::move(mapped)));
                else
                    leaked.push_back(oc::to_debug_string(mapped));
            };

            for (auto& error : source_errors)
            {
                if constexpr (move_errors)
                    std::visit(forward_error, std::move(error));
                else
                    std::visit(forward_error, error);
            }

            OC_ASSERTS_ALWAYS(leaked.empty(), impl::describe_leaked_errors(leaked, NewSet::type_names()));
            return target::from_errors(std::move(forwarded));
        }
    }

    template <class... Args>
    explicit result(std::in_place_index_t<0>, Args&&... args) : _state(std::in_place_index<0>, std::forward<Args>(args)...)
    {
    }
    explicit result(std::in_place_index_t<1>, std::vector<error_type> errors)
      : _state(std::in_place_index<1>, std::move(errors))
    {
    }

    /// exactly one of value / errors is present
    /// only a throwing move during assignment can leave the storage valueless
    [[nodiscard]] bool is_well_formed() const
    {
        if (_state.valueless_by_exception())
            return false;
        return is_successful() || !std::get<1>(_state).empty();
    }

    // members
private:
    std::variant<T, std::vector<error_type>> _state;
};

// =========================================================================================================
// Construction
// =========================================================================================================
//
// Es... is either the declared error types or a single error_set<...>:
//   oc::success<int, not_found, timeout>(42)
//   oc::failure<int, lookup_errors>(timeout{})
//

namespace oc
{
/// successful result
template <class T, class... Es, class U = T>
[[nodiscard]] result<T, error_set_of<Es...>> success(U&& value)
{
    return result<T, error_set_of<Es...>>::from_value(std::forward<U>(value));
}

/// failed result with a single error
/// a declared error type always succeeds, an undeclared type does not compile
/// a std::variant is checked at runtime: an undeclared active alternative is a contract violation
template <class T, class... Es, class E>
    requires member_candidate<E, error_set_of<Es...>>
[[nodiscard]] result<T, error_set_of<Es...>> failure(E&& err)
{
    using set = error_set_of<Es...>;
    using target = result<T, set>;

    OC_ASSERTS_ALWAYS(set::is_member(err), impl::describe_undeclared_error(oc::to_debug_string(err), set::type_names()));

    auto errors = std::vector<typename target::error_type>();
    errors.push_back(*set::narrow(std::forward<E>(err)));
    return target::from_errors(std::move(errors));
}

/// failed result with all errors of the range, in order
/// Precondition: errs is not empty and every element is a member of the declared set
template <class T, class... Es, std::ranges::input_range Range>
    requires member_candidate<std::ranges::range_value_t<Range>, error_set_of<Es...>>
[[nodiscard]] result<T, error_set_of<Es...>> failures(Range&& errs)
{
    using set = error_set_of<Es...>;
    using target = result<T, set>;

    auto errors = std::vector<typename target::error_type>();
    auto undeclared = std::vector<std::string>();

    for (auto&& e : errs)
    {
        if (set::is_member(e))
            errors.push_back(*set::narrow(std::forward<decltype(e)>(e)));
        else
            undeclared.push_back(oc::to_debug_string(e));
    }

    OC_ASSERTS_ALWAYS(undeclared.empty(), impl::describe_undeclared_errors(undeclared, set::type_names()));
    return target::from_errors(std::move(errors));
}

/// braced list overload: oc::failures<int, not_found, timeout>({not_found{}, timeout{}})
template <class T, class... Es>
[[nodiscard]] result<T, error_set_of<Es...>> failures(std::initializer_list<typename error_set_of<Es...>::value_type> errs)
{
    return result<T, error_set_of<Es...>>::from_errors(std::vector<typename error_set_of<Es...>::value_type>(errs));
}
} // namespace oc
