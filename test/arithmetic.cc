#include "complete_number.hh"
#include "test.hh"
#include <vector>

int main()
{
    using cplx = std::complex<double>;

    // Small integers and halves keep every sum and product exact.
    const std::vector<complete_number> samples = {
        complete_number(0, 0),
        complete_number(1, 0),
        complete_number(-1, 0),
        complete_number(-2, 0),
        complete_number(3, 4),
        complete_number(0, 5),
        complete_number(0.5, -1.5),
        complete_number(-4, 2)
    };

    { // Addition and subtraction are componentwise
        CASE(complete_number(1, 2) + complete_number(3, 4) == complete_number(4, 6));
        CASE(complete_number(1, 2) - complete_number(3, 5) == complete_number(-2, -3));
        CASE(-complete_number(1, -2) == complete_number(-1, 2));
        CASE(
            complete_number(cplx(1, 1), cplx(2, 0)) + complete_number(cplx(0, 1), cplx(0, 3)) ==
            complete_number(cplx(1, 2), cplx(2, 3))
        );

        for(const complete_number& a: samples)
        {
            CASE(a + complete_number() == a);
            CASE(a - a == complete_number());
            for(const complete_number& b: samples)
            {
                CASE(a + b == b + a);
                for(const complete_number& c: samples)
                    CASE(*(a + b) + c == a + *(b + c));
            }
        }
    }

    { // Multiplication by the scalar zero relocates instead of destroying
        for(double x: {-7.0, -1.0, 0.0, 0.5, 3.0, 5.0, 1e6})
        {
            CASE(complete_number(x, 0) * 0 == complete_number(0, x));
            CASE(0 * complete_number(x, 0) == complete_number(0, x));
            CASE(scale(complete_number(x), 0).vanished_component() == standard_number(x));
        }

        complete_number five = complete_number(5, 0) * 0;
        complete_number three = complete_number(3, 0) * 0;
        CASE(five == complete_number(0, 5));
        CASE(three == complete_number(0, 3));
        CASE(five != three);
        CASE(five.to_standard() == three.to_standard());

        // Complex numbers vanish as a whole.
        CASE(complete_number(cplx(3, 4)) * 0 == complete_number(cplx(0, 0), cplx(3, 4)));
        CASE_STR(to_string(complete_number(cplx(3, 4)) * 0), "3u + 4uj");

        // Repeated zero multiplication keeps what already vanished.
        CASE(complete_number(2, 3) * 0 == complete_number(0, 5));
        CASE(complete_number(4, 0) * 0 * 0 == complete_number(0, 4));
    }

    { // Multiplication by a nonzero scalar
        CASE(complete_number(2, 3) * 2 == complete_number(4, 6));
        CASE(-1.5 * complete_number(2, -4) == complete_number(-3, 6));
        CASE(complete_number(cplx(1, 2), cplx(0, 1)) * 3 == complete_number(cplx(3, 6), cplx(0, 3)));
    }

    { // Products agree with standard arithmetic on standard numbers
        for(double x: {-3.0, -0.5, 0.0, 1.0, 2.0, 7.0})
        for(double y: {-2.0, 0.25, 1.0, 3.0, 11.0})
        {
            std::optional<complete_number> p = complete_number(x) * complete_number(y);
            CASE(p.has_value() && p->to_standard() == standard_number(x * y));
            CASE(p.has_value() && p->is_standard());
            // Same result whether the multiplier is a scalar or a number.
            CASE(p == complete_number(x) * y);
        }

        std::optional<complete_number> z =
            complete_number(cplx(1, 2)) * complete_number(cplx(3, -1));
        CASE(z.has_value() && z->to_standard() == standard_number(cplx(5, 5)));
    }

    { // Products with a standard zero match the scalar rule
        for(const complete_number& a: samples)
        {
            for(double c: {-2.0, 0.0, 0.5, 3.0})
                CASE(a * complete_number(c) == a * c);
            // Only the multiplier on the right can be the zero factor.
            CASE(complete_number(0) * a == complete_number(0));
        }
        CASE(complete_number(5) * complete_number(0) == complete_number(0, 5));
        CASE(complete_number(0) * complete_number(5) == complete_number(0));
        CASE((complete_number(0) * complete_number(5))->is_standard());
        CASE(complete_number(0) * complete_number(0) == complete_number(0));
        CASE(complete_number(cplx(3, 4)) * complete_number(cplx(0, 0)) == complete_number(cplx(0, 0), cplx(3, 4)));
    }

    { // The general product: (r1, v1) * (r2, v2) = (r1 r2, r1 v2 + v1 r2 + v1 v2)
        CASE(complete_number(2, 3) * complete_number(5, 7) == complete_number(10, 14 + 15 + 21));
        CASE(complete_number(0, 1) * complete_number(0, 1) == complete_number(0, 1));
        CASE(complete_number(0, 5) * complete_number(3, 0) == complete_number(0, 15));
        CASE(complete_number(1, 0) * complete_number(3, 4) == complete_number(3, 4));

        // The laws hold while no multiplier is a standard zero.
        for(const complete_number& a: samples)
        for(const complete_number& b: samples)
        {
            if(a.is_standard_zero() || b.is_standard_zero())
                continue;
            CASE(a * b == b * a);
            for(const complete_number& c: samples)
            {
                if(c.is_standard_zero())
                    continue;
                std::optional<complete_number> ab = a * b;
                std::optional<complete_number> bc = b * c;
                CASE(*ab * c == a * *bc);

                std::optional<complete_number> b_plus_c = b + c;
                if(b_plus_c->is_standard_zero())
                    continue;
                CASE(a * *b_plus_c == *(a * b) + *(a * c));
            }
        }

        // A sum that cancels to a standard zero becomes the zero factor, so
        // distributivity breaks there.
        complete_number one(1);
        complete_number minus_one(-1);
        CASE(one * *(one + minus_one) == complete_number(0, 1));
        CASE(*(one * one) + *(one * minus_one) == complete_number(0));
        CASE(one * *(one + minus_one) != *(one * one) + *(one * minus_one));
    }

    { // Division
        CASE(complete_number(4, 6) / 2 == complete_number(2, 3));
        CASE(complete_number(cplx(2, 4)) / 2 == complete_number(cplx(1, 2)));

        for(double x: {-7.0, 0.0, 0.5, 3.0, 5.0})
        {
            complete_number vanished = complete_number(x) * 0;
            CASE(vanished / 0 == complete_number(x));
        }
        CASE(complete_number(cplx(3, 4)) * 0 / 0 == complete_number(cplx(3, 4)));

        // A standard part can't be divided by zero.
        CASE(!(complete_number(1, 2) / 0).has_value());
        CASE(!(complete_number(cplx(0, 1)) / 0).has_value());
    }

    { // Vanishing summation: boxes and crates
        complete_number box = complete_number(5, 0) * 0;
        complete_number crate = complete_number(3, 0) * 0;
        std::optional<complete_number> total = box + crate;
        CASE(total == complete_number(0, 8));
        CASE_STR(to_string(*total), "8u");
        CASE(*total / 0 == complete_number(8));
    }

    { // Per-axis absorption
        complete_number z(cplx(3, 4));
        CASE(scale_real_axis(z, 0) == complete_number(cplx(0, 4), cplx(3, 0)));
        CASE_STR(to_string(scale_real_axis(z, 0)), "4j + 3u");
        CASE(scale_imag_axis(z, 0) == complete_number(cplx(3, 0), cplx(0, 4)));
        CASE_STR(to_string(scale_imag_axis(z, 0)), "3 + 4uj");
        CASE(scale_imag_axis(scale_real_axis(z, 0), 0) == z * 0);

        CASE(scale_real_axis(z, 1) == z);
        CASE(scale_imag_axis(z, 1) == z);
        CASE(scale_real_axis(z, 2) == complete_number(cplx(6, 4)));
        CASE(scale_imag_axis(z, -1) == complete_number(cplx(3, -4)));

        complete_number r(3, 1);
        CASE(scale_real_axis(r, 0) == r * 0);
        CASE(scale_real_axis(r, 2) == r * 2);
        CASE(scale_imag_axis(r, 0) == r);
        CASE(scale_real_axis(r, 0).kind() == numeric_kind::real);
    }

    { // Mixing numeric kinds requires lifting
        complete_number a = 3;
        complete_number b(cplx(3, 4), cplx(0, 0));
        CASE(!(a + b).has_value());
        CASE(!(b + a).has_value());
        CASE(!(a - b).has_value());
        CASE(!(a * b).has_value());
        CASE(!(b * complete_number(0)).has_value());

        std::optional<complete_number> lifted = lift(a) + b;
        CASE(lifted.has_value() && *lifted == complete_number(cplx(6, 4)));
        CASE(lifted.has_value() && lifted->kind() == numeric_kind::complex);
        CASE(lift(a) * b == complete_number(cplx(9, 12)));
        // Scalars are real, so they combine with either kind.
        CASE(b * 2 == complete_number(cplx(6, 8)));
    }

    FINISH;
}
