#ifndef COMPLETENUMBERS_SCALAR_HH
#define COMPLETENUMBERS_SCALAR_HH
#include <cmath>
#include <complex>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <variant>
#include <vector>

// A standard number is anything ordinary arithmetic works with: either a real
// scalar or a complex scalar. Complete numbers are built on top of these.
using standard_number = std::variant<double, std::complex<double>>;

enum class numeric_kind
{
    real,
    complex
};

inline numeric_kind kind_of(const standard_number& n)
{
    return std::holds_alternative<double>(n) ?
        numeric_kind::real : numeric_kind::complex;
}

inline const char* kind_name(numeric_kind kind)
{
    return kind == numeric_kind::real ? "real" : "complex";
}

// Real scalars embed into the complex plane on the real axis.
inline std::complex<double> as_complex(const standard_number& n)
{
    if(const double* d = std::get_if<double>(&n))
        return *d;
    return std::get<std::complex<double>>(n);
}

inline bool is_integer(double d)
{
    // Outside of this range, the int64_t cast would be undefined.
    if(!std::isfinite(d) || fabs(d) >= 9.0e15)
        return false;
    return d == double(int64_t(d));
}

// Uses the shortest of 15 or 17 significant digits that reads back as 'd'.
inline std::string to_string(double d)
{
    if(is_integer(d))
        return std::to_string(int64_t(d));

    char buf[32];
    snprintf(buf, sizeof(buf), "%.15g", d);
    if(strtod(buf, nullptr) != d)
        snprintf(buf, sizeof(buf), "%.17g", d);
    return buf;
}

// Joins printed terms with " + ", folding the sign of negative terms into the
// separator: {"2", "-3u"} becomes "2 - 3u".
inline std::string join_terms(const std::vector<std::string>& terms)
{
    std::string ret;
    for(size_t i = 0; i < terms.size(); ++i)
    {
        if(i == 0)
            ret += terms[i];
        else if(terms[i][0] == '-')
            ret += " - " + terms[i].substr(1);
        else
            ret += " + " + terms[i];
    }
    return ret;
}

inline std::string to_string(const standard_number& n)
{
    if(const double* d = std::get_if<double>(&n))
        return to_string(*d);

    std::complex<double> c = std::get<std::complex<double>>(n);
    std::vector<std::string> terms;
    if(c.real() != 0 || c.imag() == 0)
        terms.push_back(to_string(c.real()));
    if(c.imag() != 0)
        terms.push_back(to_string(c.imag()) + "j");
    return join_terms(terms);
}

#endif
