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

#include <pmucat/metrics/conditional.hpp>

#include <pmucat/error.hpp>
#include <pmucat/log.hpp>

#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <iterator>
#include <memory>
#include <vector>

#include <cctype>

namespace
{
struct Node;

struct Element
{
    enum class Kind
    {
        TEXT,
        GROUP,
        IF,
        ELSE
    };

    Kind kind;
    std::string text;
    // set for GROUP, the content between the parentheses
    std::unique_ptr<Node> group;
};

using Sequence = std::vector<Element>;

struct Conditional
{
    Sequence then;
    Sequence condition;
    std::unique_ptr<Node> otherwise;
};

// either a plain sequence or, if conditional is set, a conditional
struct Node
{
    Sequence sequence;
    std::unique_ptr<Conditional> conditional;
};

bool is_word_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

bool keyword_at(const std::string& text, std::size_t pos, const std::string& keyword)
{
    if (text.compare(pos, keyword.size(), keyword) != 0)
    {
        return false;
    }
    if (pos > 0 && is_word_char(text[pos - 1]))
    {
        return false;
    }
    auto end = pos + keyword.size();
    return end >= text.size() || !is_word_char(text[end]);
}

bool contains_keyword(const std::string& text, const std::string& keyword)
{
    for (auto pos = text.find(keyword); pos != std::string::npos;
         pos = text.find(keyword, pos + 1))
    {
        if (keyword_at(text, pos, keyword))
        {
            return true;
        }
    }
    return false;
}

// no group and nothing but whitespace
bool is_blank(const Sequence& sequence)
{
    return std::all_of(sequence.begin(), sequence.end(), [](const Element& element) {
        return element.kind == Element::Kind::TEXT && boost::trim_copy(element.text).empty();
    });
}

class Parser
{
public:
    explicit Parser(const std::string& formula) : formula_(formula)
    {
    }

    std::unique_ptr<Node> parse()
    {
        pos_ = 0;
        return parse_scope(false);
    }

private:
    std::unique_ptr<Node> parse_scope(bool closed_by_paren)
    {
        const auto start = pos_;
        Sequence elements;
        std::string text;

        auto flush_text = [&]() {
            if (!text.empty())
            {
                elements.push_back(Element{ Element::Kind::TEXT, std::move(text), nullptr });
                text.clear();
            }
        };

        while (pos_ < formula_.size())
        {
            const char c = formula_[pos_];
            if (c == '(')
            {
                flush_text();
                pos_++;
                auto group = parse_scope(true);
                elements.push_back(Element{ Element::Kind::GROUP, "", std::move(group) });
            }
            else if (c == ')')
            {
                if (!closed_by_paren)
                {
                    throw pmucat::ConditionalSyntaxError("unbalanced ')'",
                                                         formula_.substr(0, pos_ + 1));
                }
                flush_text();
                auto fragment = formula_.substr(start, pos_ - start);
                pos_++;
                return build(std::move(elements), fragment);
            }
            else if (keyword_at(formula_, pos_, "if"))
            {
                flush_text();
                elements.push_back(Element{ Element::Kind::IF, "if", nullptr });
                pos_ += 2;
            }
            else if (keyword_at(formula_, pos_, "else"))
            {
                flush_text();
                elements.push_back(Element{ Element::Kind::ELSE, "else", nullptr });
                pos_ += 4;
            }
            else
            {
                text += c;
                pos_++;
            }
        }

        if (closed_by_paren)
        {
            throw pmucat::ConditionalSyntaxError("unbalanced '('", formula_.substr(start - 1));
        }
        flush_text();
        return build(std::move(elements), formula_.substr(start));
    }

    // splits a scope at its first if/else pair, the else branch may chain further conditionals
    std::unique_ptr<Node> build(Sequence elements, const std::string& fragment)
    {
        auto is_keyword = [](const Element& element) {
            return element.kind == Element::Kind::IF || element.kind == Element::Kind::ELSE;
        };

        auto node = std::make_unique<Node>();

        auto if_it = std::find_if(elements.begin(), elements.end(), is_keyword);
        if (if_it == elements.end())
        {
            node->sequence = std::move(elements);
            return node;
        }
        if (if_it->kind == Element::Kind::ELSE)
        {
            throw pmucat::ConditionalSyntaxError("else without if", fragment);
        }

        auto else_it = std::find_if(std::next(if_it), elements.end(), is_keyword);
        if (else_it == elements.end())
        {
            throw pmucat::ConditionalSyntaxError("if without else", fragment);
        }
        if (else_it->kind == Element::Kind::IF)
        {
            throw pmucat::ConditionalSyntaxError("if inside a condition", fragment);
        }

        auto conditional = std::make_unique<Conditional>();
        std::move(elements.begin(), if_it, std::back_inserter(conditional->then));
        std::move(std::next(if_it), else_it, std::back_inserter(conditional->condition));

        Sequence otherwise;
        std::move(std::next(else_it), elements.end(), std::back_inserter(otherwise));

        if (is_blank(conditional->then) || is_blank(conditional->condition) || is_blank(otherwise))
        {
            throw pmucat::ConditionalSyntaxError("empty operand", fragment);
        }
        conditional->otherwise = build(std::move(otherwise), fragment);

        node->conditional = std::move(conditional);
        return node;
    }

    const std::string& formula_;
    std::size_t pos_ = 0;
};

class Renderer
{
public:
    std::string render(const Node& node)
    {
        if (node.conditional)
        {
            return render_conditional(*node.conditional, false);
        }
        return render_sequence(node.sequence);
    }

private:
    std::string render_sequence(const Sequence& sequence)
    {
        std::string result;
        // a rewritten group is separated from the following text by one extra space
        bool pending_gap = false;

        for (const auto& element : sequence)
        {
            if (pending_gap)
            {
                result += ' ';
                pending_gap = false;
            }

            if (element.kind == Element::Kind::GROUP && element.group->conditional)
            {
                result += "( " + render_conditional(*element.group->conditional, true) + " )";
                pending_gap = true;
            }
            else if (element.kind == Element::Kind::GROUP)
            {
                result += "(" + render_sequence(element.group->sequence) + ")";
            }
            else
            {
                result += element.text;
            }
        }
        return result;
    }

    std::string render_conditional(const Conditional& conditional, bool fills_group)
    {
        auto then = render_sequence(conditional.then);
        // inside a group the then branch keeps its leading whitespace
        then = fills_group ? boost::trim_right_copy(then) : boost::trim_copy(then);

        return boost::trim_copy(render_sequence(conditional.condition)) + " ? " + then + " : " +
               boost::trim_copy(render(*conditional.otherwise));
    }
};
} // namespace

namespace pmucat
{
namespace metrics
{

std::string transform_conditional(const std::string& formula)
{
    if (!contains_keyword(formula, "if"))
    {
        return formula;
    }

    auto tree = Parser(formula).parse();
    auto result = Renderer().render(*tree);

    Log::trace() << "transformed conditional: " << formula << " -> " << result;
    return result;
}

} // namespace metrics
} // namespace pmucat
