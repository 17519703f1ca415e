#include "complete_number.hh"
#include <cstdio>
#include <vector>

complete_number::complete_number(double real, double vanished)
:   standard(real), vanished(vanished), number_kind(numeric_kind::real)
{
}

complete_number::complete_number(
    std::complex<double> real,
    std::complex<double> vanished
):  standard(real), vanished(vanished), number_kind(numeric_kind::complex)
{
}

complete_number complete_number::create(const standard_number& real)
{
    return with_kind(kind_of(real), as_complex(real), 0.0);
}

std::optional<complete_number> complete_number::create(
    const standard_number& real,
    const standard_number& vanished
){
    numeric_kind real_kind = kind_of(real);
    numeric_kind vanished_kind = kind_of(vanished);
    if(real_kind != vanished_kind)
    {
        fprintf(
            stderr,
            "Numeric kind mismatch in construction: %s and %s\n",
            kind_name(real_kind),
            kind_name(vanished_kind)
        );
        return {};
    }
    return with_kind(real_kind, as_complex(real), as_complex(vanished));
}

complete_number complete_number::with_kind(
    numeric_kind kind,
    std::complex<double> real,
    std::complex<double> vanished
){
    if(kind == numeric_kind::real)
        return complete_number(real.real(), vanished.real());
    return complete_number(real, vanished);
}

standard_number complete_number::to_standard() const
{
    if(number_kind == numeric_kind::real)
        return standard.real();
    return standard;
}

standard_number complete_number::vanished_component() const
{
    if(number_kind == numeric_kind::real)
        return vanished.real();
    return vanished;
}

bool operator==(const complete_number& a, const complete_number& b)
{
    return a.real_part() == b.real_part() &&
        a.vanished_part() == b.vanished_part();
}

bool operator!=(const complete_number& a, const complete_number& b)
{
    return !(a == b);
}

static bool same_kind(
    const complete_number& a,
    const complete_number& b,
    const char* operation
){
    if(a.kind() == b.kind())
        return true;

    fprintf(
        stderr,
        "Numeric kind mismatch in %s: %s and %s\n",
        operation,
        kind_name(a.kind()),
        kind_name(b.kind())
    );
    return false;
}

complete_number lift(const complete_number& a)
{
    return complete_number::with_kind(
        numeric_kind::complex, a.real_part(), a.vanished_part()
    );
}

complete_number negate(const complete_number& a)
{
    return complete_number::with_kind(
        a.kind(), -a.real_part(), -a.vanished_part()
    );
}

std::optional<complete_number> sum(const complete_number& a, const complete_number& b)
{
    if(!same_kind(a, b, "addition"))
        return {};
    return complete_number::with_kind(
        a.kind(),
        a.real_part() + b.real_part(),
        a.vanished_part() + b.vanished_part()
    );
}

std::optional<complete_number> difference(const complete_number& a, const complete_number& b)
{
    if(!same_kind(a, b, "subtraction"))
        return {};
    return complete_number::with_kind(
        a.kind(),
        a.real_part() - b.real_part(),
        a.vanished_part() - b.vanished_part()
    );
}

std::optional<complete_number> multiply(const complete_number& a, const complete_number& b)
{
    if(!same_kind(a, b, "multiplication"))
        return {};

    std::complex<double> r1 = a.real_part();
    std::complex<double> v1 = a.vanished_part();
    std::complex<double> r2 = b.real_part();
    std::complex<double> v2 = b.vanished_part();

    // The right operand is the multiplier. A standard zero there is the zero
    // factor (0, 1); on the left it is just the value 0.
    if(b.is_standard_zero()) v2 = 1.0;

    return complete_number::with_kind(
        a.kind(),
        r1 * r2,
        r1 * v2 + v1 * r2 + v1 * v2
    );
}

complete_number scale(const complete_number& a, double factor)
{
    if(factor == 0)
    { // Nothing vanishes, it just moves over.
        return complete_number::with_kind(
            a.kind(), 0.0, a.real_part() + a.vanished_part()
        );
    }
    return complete_number::with_kind(
        a.kind(), a.real_part() * factor, a.vanished_part() * factor
    );
}

complete_number scale_real_axis(const complete_number& a, double factor)
{
    std::complex<double> r = a.real_part();
    std::complex<double> v = a.vanished_part();
    if(factor == 0)
    {
        return complete_number::with_kind(
            a.kind(),
            {0.0, r.imag()},
            {v.real() + r.real(), v.imag()}
        );
    }
    return complete_number::with_kind(
        a.kind(),
        {r.real() * factor, r.imag()},
        {v.real() * factor, v.imag()}
    );
}

complete_number scale_imag_axis(const complete_number& a, double factor)
{
    std::complex<double> r = a.real_part();
    std::complex<double> v = a.vanished_part();
    if(factor == 0)
    {
        return complete_number::with_kind(
            a.kind(),
            {r.real(), 0.0},
            {v.real(), v.imag() + r.imag()}
        );
    }
    return complete_number::with_kind(
        a.kind(),
        {r.real(), r.imag() * factor},
        {v.real(), v.imag() * factor}
    );
}

std::optional<complete_number> divide(const complete_number& a, double divisor)
{
    if(divisor == 0)
    {
        if(a.real_part() != 0.0)
        {
            fprintf(
                stderr,
                "Division by zero of a number with a standard part: %s\n",
                to_string(a).c_str()
            );
            return {};
        }
        return complete_number::with_kind(a.kind(), a.vanished_part(), 0.0);
    }
    return complete_number::with_kind(
        a.kind(), a.real_part() / divisor, a.vanished_part() / divisor
    );
}

std::string to_string(const complete_number& a)
{
    std::complex<double> r = a.real_part();
    std::complex<double> v = a.vanished_part();

    std::vector<std::string> terms;
    if(r.real() != 0 || (r.imag() == 0 && v == 0.0))
        terms.push_back(to_string(r.real()));
    if(r.imag() != 0)
        terms.push_back(to_string(r.imag()) + "j");
    if(v.real() != 0)
        terms.push_back(to_string(v.real()) + "u");
    if(v.imag() != 0)
        terms.push_back(to_string(v.imag()) + "uj");
    return join_terms(terms);
}
