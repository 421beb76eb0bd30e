#include <outcome-core/result.hh>

namespace
{
// "[a, b, c]" from already rendered errors
std::string join_rendered(std::span<std::string const> rendered_errors)
{
    std::string s = "[";
    for (auto const& e : rendered_errors)
    {
        if (s.size() > 1)
            s += ", ";
        s += e;
    }
    s += "]";
    return s;
}
} // namespace

std::string oc::impl::describe_unhandled_errors(std::string_view rendered_errors)
{
    std::string s = "unhandled expected errors: ";
    s += rendered_errors;
    s += "\n  (check is_failed() or has_error<E>() before accessing the value)";
    return s;
}

std::string oc::impl::describe_undeclared_error(std::string_view rendered_error, std::string_view declared_set)
{
    std::string s = "unexpected error ";
    s += rendered_error;
    s += " is not declared in ";
    s += declared_set;
    return s;
}

std::string oc::impl::describe_undeclared_errors(std::span<std::string const> rendered_errors, std::string_view declared_set)
{
    std::string s = "unexpected errors ";
    s += join_rendered(rendered_errors);
    s += " are not declared in ";
    s += declared_set;
    return s;
}

std::string oc::impl::describe_leaked_errors(std::span<std::string const> rendered_errors, std::string_view declared_set)
{
    std::string s = "cannot forward unexpected errors ";
    s += join_rendered(rendered_errors);
    s += " into ";
    s += declared_set;
    s += "\n  (the failure callback must map every error to a member of the new error set)";
    return s;
}
