#include <limits>
#include <string>

#include <gtest/gtest.h>

#include "exact/Rational.hpp"

using namespace exact;

TEST(Parse, Parse_fraction) {
    auto q = Rational::from("3/4");
    EXPECT_EQ(q.numerator(), AInt(3L));
    EXPECT_EQ(q.denominator(), AInt(4L));

    EXPECT_TRUE(q.equals(0.75));
    EXPECT_TRUE(q.equals("0.75"));
    EXPECT_TRUE(Rational::from(0.75).equals(q));
}

TEST(Parse, Parse_fraction_normalizes) {
    EXPECT_EQ(Rational::from("6/8").toFractionString(), "3/4");
    EXPECT_EQ(Rational::from("-6/8").toFractionString(), "-3/4");
    EXPECT_EQ(Rational::from("6/-8").toFractionString(), "-3/4");
    EXPECT_EQ(Rational::from(" 1 / 2 ").toFractionString(), "1/2");
    EXPECT_EQ(Rational::from("0/5").toFractionString(), "0/1");
}

TEST(Parse, Parse_fraction_round_trip) {
    for(auto q : {Rational(3, 4), Rational(-5, 9), Rational(0, 1), Rational(AInt("98765432109876543210"), AInt(3L))}){
        EXPECT_EQ(Rational::from(q.toFractionString()), q);
    }
}

TEST(Parse, Parse_fraction_rejects) {
    EXPECT_THROW(Rational::from("1/2/3"), ParseError);
    EXPECT_THROW(Rational::from("/5"), ParseError);
    EXPECT_THROW(Rational::from("5/"), ParseError);
    EXPECT_THROW(Rational::from("1.5/2"), ParseError);
    EXPECT_THROW(Rational::from("a/2"), ParseError);
    EXPECT_THROW(Rational::from("1/"), ParseError);
}

TEST(Parse, Parse_fraction_zero_denominator) {
    EXPECT_THROW(Rational::from("1/0"), DivisionByZero);
}

TEST(Parse, Parse_error_details) {
    try{
        Rational::from("1/x");
        FAIL() << "expected ParseError";
    }
    catch(const ParseError &e){
        EXPECT_EQ(e.input(), "1/x");
        EXPECT_NE(e.cause().find("Unexpected character 'x'"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("1/x"), std::string::npos);
    }

    try{
        Rational::from("1/2/3");
        FAIL() << "expected ParseError";
    }
    catch(const ParseError &e){
        EXPECT_EQ(e.input(), "1/2/3");
        EXPECT_TRUE(e.cause().empty());
    }
}

TEST(Parse, Parse_decimal) {
    EXPECT_EQ(Rational::from("0.75").toFractionString(), "3/4");
    EXPECT_EQ(Rational::from("12").toFractionString(), "12/1");
    EXPECT_EQ(Rational::from("12.").toFractionString(), "12/1");
    EXPECT_EQ(Rational::from(".5").toFractionString(), "1/2");
    EXPECT_EQ(Rational::from("0.001").toFractionString(), "1/1000");
    EXPECT_EQ(Rational::from("3.14159").toFractionString(), "314159/100000");
    EXPECT_EQ(Rational::from("  2.50  ").toFractionString(), "5/2");
}

TEST(Parse, Parse_decimal_signed) {
    EXPECT_EQ(Rational::from("-0.75").toFractionString(), "-3/4");
    EXPECT_EQ(Rational::from("+0.75").toFractionString(), "3/4");
    EXPECT_EQ(Rational::from("-12").toFractionString(), "-12/1");
    EXPECT_EQ(Rational::from(-0.75).toFractionString(), "-3/4");
}

TEST(Parse, Parse_decimal_exponent) {
    EXPECT_EQ(Rational::from("1e3").toFractionString(), "1000/1");
    EXPECT_EQ(Rational::from("1.5E-3").toFractionString(), "3/2000");
    EXPECT_EQ(Rational::from("-2.5e+1").toFractionString(), "-25/1");
}

TEST(Parse, Parse_decimal_long) {
    auto q = Rational::from("0.1234567890123456789012345678901234567890");
    EXPECT_EQ(q.denominator().toString(), "1000000000000000000000000000000000000000");
    EXPECT_EQ(q.toDecimalString(40), "0.123456789012345678901234567890123456789");
}

TEST(Parse, Parse_decimal_rejects) {
    EXPECT_THROW(Rational::from(""), ParseError);
    EXPECT_THROW(Rational::from("   "), ParseError);
    EXPECT_THROW(Rational::from("."), ParseError);
    EXPECT_THROW(Rational::from("-"), ParseError);
    EXPECT_THROW(Rational::from("1.2.3"), ParseError);
    EXPECT_THROW(Rational::from("--1"), ParseError);
    EXPECT_THROW(Rational::from("1-"), ParseError);
    EXPECT_THROW(Rational::from("abc"), ParseError);
    EXPECT_THROW(Rational::from("NaN"), ParseError);
    EXPECT_THROW(Rational::from("Infinity"), ParseError);
    EXPECT_THROW(Rational::from("1e"), ParseError);
    EXPECT_THROW(Rational::from("1e99999999999"), ParseError);
    EXPECT_THROW(Rational::from("0x10"), ParseError);
}

TEST(Parse, Parse_non_ascii) {
    try{
        Rational::from("1\xC2\xBD");
        FAIL() << "expected ParseError";
    }
    catch(const ParseError &e){
        EXPECT_NE(std::string(e.what()).find("'\xC2\xBD'"), std::string::npos);
    }

    EXPECT_THROW(Rational::from("1\xFF"), ParseError);
}

TEST(Parse, Parse_floating_point) {
    EXPECT_EQ(Rational::from(0.1).toFractionString(), "1/10");
    EXPECT_EQ(Rational::from(2.5f).toFractionString(), "5/2");
    EXPECT_EQ(Rational::from(1e-7).toFractionString(), "1/10000000");
    EXPECT_EQ(Rational::from(1e21).toFractionString(), "1000000000000000000000/1");
    EXPECT_EQ(Rational::from(0.0).toFractionString(), "0/1");
}

TEST(Parse, Parse_floating_point_keeps_type) {
    EXPECT_EQ(Rational::from(0.1f).toFractionString(), "1/10");
    EXPECT_EQ(Rational::from(-3.3f).toFractionString(), "-33/10");
    EXPECT_EQ(Rational::from(0.1L).toFractionString(), "1/10");
    EXPECT_TRUE(Rational(1, 10).add(0.2f).equals("3/10"));

    auto tiny = Rational::from(std::numeric_limits<long double>::denorm_min());
    EXPECT_GT(tiny.denominator().bitsRequired(), 16000u);
    EXPECT_EQ(tiny.numerator().sign(), 1);

    EXPECT_THROW(Rational::from(std::numeric_limits<float>::infinity()), ParseError);
    EXPECT_THROW(Rational::from(std::numeric_limits<long double>::quiet_NaN()), ParseError);
}

TEST(Parse, Parse_floating_point_rejects) {
    EXPECT_THROW(Rational::from(std::numeric_limits<double>::quiet_NaN()), ParseError);
    EXPECT_THROW(Rational::from(std::numeric_limits<double>::infinity()), ParseError);
    EXPECT_THROW(Rational::from(-std::numeric_limits<double>::infinity()), ParseError);
}

TEST(Parse, Parse_std_string) {
    std::string text = "7/21";
    std::string_view view = text;
    EXPECT_EQ(Rational::from(text).toFractionString(), "1/3");
    EXPECT_EQ(Rational::from(view).toFractionString(), "1/3");
    EXPECT_EQ(Rational::from(text.c_str()).toFractionString(), "1/3");
}
