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

#pragma once

#include <string>

namespace pmucat
{
namespace metrics
{

/**
 * Rewrites "THEN if COND else OTHERWISE" formulas into "COND ? THEN : OTHERWISE".
 *
 * Conditionals nested in parentheses are rewritten in place, chained conditionals in the else
 * branch are rewritten recursively. Formulas without an "if" keyword are returned unchanged.
 *
 * A conditional that fills a parenthesized group is rendered as "( COND ? THEN : OTHERWISE )".
 * Inside such a group THEN keeps its leading whitespace and the group is followed by one extra
 * space before the next text of the enclosing expression. Downstream consumers rely on this exact
 * text, e.g. "1 - ( (a) if c else d )" becomes "1 - ( c ?  (a) : d )".
 *
 * @throws ConditionalSyntaxError for "if" without "else", "else" without "if", an "if" inside a
 *         condition and unbalanced parentheses
 */
std::string transform_conditional(const std::string& formula);

} // namespace metrics
} // namespace pmucat
