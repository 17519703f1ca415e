#ifndef COMPLETENUMBERS_COMPLETE_NUMBER_HH
#define COMPLETENUMBERS_COMPLETE_NUMBER_HH
#include "scalar.hh"
#include <optional>
#include <string>

// An element of the complete number set U. Next to its standard part, it
// carries a vanished part which receives whatever multiplication by zero would
// otherwise destroy. The vanished part is printed with a 'u' suffix, so
// 5 * 0 = 5u and 3 * 0 = 3u, which are not equal.
//
// Products of two complete numbers treat them as r + v*u, where the formal
// unit u is idempotent (u*u = u):
//
//     (r1, v1) * (r2, v2) = (r1*r2, r1*v2 + v1*r2 + v1*v2)
//
// The right operand is the multiplier. If it is a standard zero (0, 0), it is
// the zero factor and enters as (0, 1), which gives (x, 0) * 0 = (0, x), the
// same as scale() with a zero factor. A standard zero on the left is just the
// value 0, so 0 * 5 = 0. Hence a * complete_number(c) == a * c for every real
// c. Commutativity, associativity and distributivity hold as long as no
// multiplier, including a sum used as one, is a standard zero.
//
// Both parts share a numeric kind. Values are immutable; all operations
// return new values.
class complete_number
{
public:
    complete_number(double real = 0.0, double vanished = 0.0);
    complete_number(
        std::complex<double> real,
        std::complex<double> vanished = 0.0
    );

    // The vanished part is a zero of the same kind as 'real'.
    static complete_number create(const standard_number& real);
    // Fails if 'real' and 'vanished' are of different numeric kinds.
    static std::optional<complete_number> create(
        const standard_number& real,
        const standard_number& vanished
    );

    // Imaginary parts are dropped for numeric_kind::real.
    static complete_number with_kind(
        numeric_kind kind,
        std::complex<double> real,
        std::complex<double> vanished
    );

    inline numeric_kind kind() const { return number_kind; }
    inline std::complex<double> real_part() const { return standard; }
    inline std::complex<double> vanished_part() const { return vanished; }

    // The lossy view of ordinary arithmetic, which forgets the vanished part.
    standard_number to_standard() const;
    // What ordinary arithmetic would have destroyed.
    standard_number vanished_component() const;

    inline bool is_standard() const { return vanished == 0.0; }
    inline bool is_standard_zero() const
    { return standard == 0.0 && vanished == 0.0; }

private:
    std::complex<double> standard;
    std::complex<double> vanished;
    numeric_kind number_kind;
};

// Pairwise equality of both parts. The numeric kind does not participate, just
// like 3 == 3+0j for standard numbers.
bool operator==(const complete_number& a, const complete_number& b);
bool operator!=(const complete_number& a, const complete_number& b);

// Explicit domain lifting from the real to the complex kind.
complete_number lift(const complete_number& a);

complete_number negate(const complete_number& a);

// These fail when the operands are of different numeric kinds.
std::optional<complete_number> sum(const complete_number& a, const complete_number& b);
std::optional<complete_number> difference(const complete_number& a, const complete_number& b);
std::optional<complete_number> multiply(const complete_number& a, const complete_number& b);

// Multiplication by a real scalar. Zero relocates everything into the vanished
// part: (r, v) * 0 = (0, r + v). A scalar is the multiplier on either side, so
// c * a == a * c.
complete_number scale(const complete_number& a, double factor);

// Like scale(), but only touches the real or the imaginary axis of both parts.
// A zero factor relocates that axis of the standard part into the vanished
// part: absorbing the real axis of 3+4j gives 4j + 3u.
complete_number scale_real_axis(const complete_number& a, double factor);
complete_number scale_imag_axis(const complete_number& a, double factor);

// Division by zero recovers the vanished part, (0, v) / 0 = (v, 0). It fails
// if the standard part is nonzero.
std::optional<complete_number> divide(const complete_number& a, double divisor);

std::string to_string(const complete_number& a);

inline complete_number operator-(const complete_number& a)
{ return negate(a); }
inline std::optional<complete_number> operator+(const complete_number& a, const complete_number& b)
{ return sum(a, b); }
inline std::optional<complete_number> operator-(const complete_number& a, const complete_number& b)
{ return difference(a, b); }
inline std::optional<complete_number> operator*(const complete_number& a, const complete_number& b)
{ return multiply(a, b); }
inline complete_number operator*(const complete_number& a, double factor)
{ return scale(a, factor); }
inline complete_number operator*(double factor, const complete_number& a)
{ return scale(a, factor); }
inline std::optional<complete_number> operator/(const complete_number& a, double divisor)
{ return divide(a, divisor); }

#endif
