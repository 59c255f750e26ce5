/*
 * This file is part of the pmucat software.
 * PMU event and metric catalog processing
 *
 * Copyright (c) 2024,
 *    Technische Universitaet Dresden, Germany
 *
 * pmucat is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * pmucat is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with pmucat.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <catch2/catch.hpp>

#include <pmucat/error.hpp>
#include <pmucat/metrics/conditional.hpp>

#include <string>

using pmucat::metrics::transform_conditional;

TEST_CASE("formulas without conditional are unchanged", "[conditional]")
{
    REQUIRE(transform_conditional("100 * x / y") == "100 * x / y");
    REQUIRE(transform_conditional("[modifier] / 2") == "[modifier] / 2");
    REQUIRE(transform_conditional("[L2_RQSTS.DIFF] / [ELSE_COUNT]") ==
            "[L2_RQSTS.DIFF] / [ELSE_COUNT]");
    REQUIRE(transform_conditional("") == "");
}

TEST_CASE("conditionals are rewritten to the ternary operator", "[conditional]")
{
    SECTION("whole formula")
    {
        REQUIRE(transform_conditional("a if b else c") == "b ? a : c");
        REQUIRE(transform_conditional("1 - a / b if c > 1 else 0") == "c > 1 ? 1 - a / b : 0");
    }

    SECTION("parenthesized then branch")
    {
        REQUIRE(transform_conditional("(1 - x / y) if z > 1 else 0") ==
                "z > 1 ? (1 - x / y) : 0");
    }

    SECTION("conditional filling a group")
    {
        REQUIRE(transform_conditional("1 - ( (a) if c else d )") == "1 - ( c ?  (a) : d )");
        REQUIRE(transform_conditional("x + ( a if b else ( c if d else e ) ) * 2") ==
                "x + ( b ?  a : ( d ?  c : e ) )  * 2");
    }

    SECTION("chained conditionals")
    {
        REQUIRE(transform_conditional("a if b else c if d else e") == "b ? a : d ? c : e");
        REQUIRE(transform_conditional("a if b else c if d else e if f else g") ==
                "b ? a : d ? c : f ? e : g");
    }

    SECTION("DRAM bound")
    {
        const std::string formula =
            "100 * ( min( ( ( ( a / ( b ) ) - ( min( ( ( ( ( 1 - ( ( ( 19 * ( c * ( "
            "1 + ( d / e ) ) ) + 10 * ( ( f * ( 1 + ( d / e ) ) ) + ( g * ( 1 + ( d "
            "/ e ) ) ) + ( h * ( 1 + ( d / e ) ) ) ) ) / ( ( 19 * ( c * ( 1 + ( d / "
            "e ) ) ) + 10 * ( ( f * ( 1 + ( d / e ) ) ) + ( g * ( 1 + ( d / e ) ) ) "
            "+ ( h * ( 1 + ( d / e ) ) ) ) ) + ( 25 * ( ( i * ( 1 + ( d / e ) ) ) ) "
            "+ 33 * ( ( j * ( 1 + ( d / e ) ) ) ) ) ) ) ) ) * ( a / ( b ) ) ) if ( ( "
            "1000000 ) * ( j + i ) > e ) else 0 ) ) , ( 1 ) ) ) ) ) , ( 1 ) ) )";
        const std::string expected =
            "100 * ( min( ( ( ( a / ( b ) ) - ( min( ( ( ( ( 1000000 ) * ( j + i ) > "
            "e ) ?  ( ( 1 - ( ( ( 19 * ( c * ( 1 + ( d / e ) ) ) + 10 * ( ( f * ( 1 "
            "+ ( d / e ) ) ) + ( g * ( 1 + ( d / e ) ) ) + ( h * ( 1 + ( d / e ) ) ) "
            ") ) / ( ( 19 * ( c * ( 1 + ( d / e ) ) ) + 10 * ( ( f * ( 1 + ( d / e ) "
            ") ) + ( g * ( 1 + ( d / e ) ) ) + ( h * ( 1 + ( d / e ) ) ) ) ) + ( 25 "
            "* ( ( i * ( 1 + ( d / e ) ) ) ) + 33 * ( ( j * ( 1 + ( d / e ) ) ) ) ) "
            ") ) ) ) * ( a / ( b ) ) ) : 0 )  ) , ( 1 ) ) ) ) ) , ( 1 ) ) )";
        REQUIRE(transform_conditional(formula) == expected);
    }

    SECTION("ports utilization")
    {
        const std::string formula =
            "100 * ( ( a + ( b / ( c ) ) * ( d - e ) + ( f + ( g / ( h + i + g + j ) "
            ") * k ) ) / ( c ) if ( l < ( d - e ) ) else ( f + ( g / ( h + i + g + j "
            ") ) * k ) / ( c ) )";
        const std::string expected =
            "100 * ( ( l < ( d - e ) ) ?  ( a + ( b / ( c ) ) * ( d - e ) + ( f + ( "
            "g / ( h + i + g + j ) ) * k ) ) / ( c ) : ( f + ( g / ( h + i + g + j ) "
            ") * k ) / ( c ) )";
        REQUIRE(transform_conditional(formula) == expected);
    }
}

TEST_CASE("malformed conditionals are rejected", "[conditional]")
{
    SECTION("if without else")
    {
        REQUIRE_THROWS_AS(transform_conditional("100 * x / y if z"),
                          pmucat::ConditionalSyntaxError);
        REQUIRE_THROWS_WITH(transform_conditional("100 * x / y if z"),
                            Catch::Contains("if without else"));
    }

    SECTION("else without if")
    {
        REQUIRE_THROWS_WITH(transform_conditional("a if b else ( c else d )"),
                            Catch::Contains("else without if"));
    }

    SECTION("unbalanced parentheses")
    {
        REQUIRE_THROWS_WITH(transform_conditional("( a if b else c"),
                            Catch::Contains("unbalanced '('"));
        REQUIRE_THROWS_WITH(transform_conditional("a if b else c )"),
                            Catch::Contains("unbalanced ')'"));
    }

    SECTION("empty operands")
    {
        REQUIRE_THROWS_WITH(transform_conditional("a if b else"),
                            Catch::Contains("empty operand"));
        REQUIRE_THROWS_WITH(transform_conditional("if a else b"),
                            Catch::Contains("empty operand"));
        REQUIRE_THROWS_AS(transform_conditional("x * ( a if else b )"),
                          pmucat::ConditionalSyntaxError);
        REQUIRE_THROWS_WITH(transform_conditional("x * ( a if else b )"),
                            Catch::Contains("empty operand"));
    }

    SECTION("conditional inside a condition")
    {
        REQUIRE_THROWS_WITH(transform_conditional("a if b if c else d else e"),
                            Catch::Contains("if inside a condition"));
    }

    SECTION("the offending fragment is reported")
    {
        try
        {
            transform_conditional("1 + ( x if y )");
            FAIL("no exception thrown");
        }
        catch (const pmucat::ConditionalSyntaxError& e)
        {
            REQUIRE(e.fragment() == " x if y ");
        }
    }
}
