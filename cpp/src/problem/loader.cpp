#include "geo_debugger/problem/loader.hpp"
#include "geo_debugger/core/parse.hpp"
#include <fstream>
#include <sstream>
#include <vector>

namespace geo_debugger {

ProblemLoadError::ProblemLoadError(size_t line, const std::string& message)
    : std::runtime_error(line > 0 ? "line " + std::to_string(line) + ": " + message : message)
    , line_(line)
{}

namespace {

struct Token {
    std::string text;
    bool quoted{false};
};

std::vector<Token> tokenize(std::string_view line, size_t line_no) {
    std::vector<Token> tokens;
    size_t i = 0;
    while (i < line.size()) {
        char c = line[i];
        if (c == '#') {
            break;
        }
        if (c == ' ' || c == '\t' || c == '\r') {
            ++i;
            continue;
        }
        if (c == '"') {
            size_t close = line.find('"', i + 1);
            if (close == std::string_view::npos) {
                throw ProblemLoadError(line_no, "unterminated label string");
            }
            tokens.push_back(Token{std::string(line.substr(i + 1, close - i - 1)), true});
            i = close + 1;
            continue;
        }
        size_t start = i;
        while (i < line.size() && line[i] != ' ' && line[i] != '\t' && line[i] != '\r' &&
               line[i] != '#' && line[i] != '"') {
            ++i;
        }
        tokens.push_back(Token{std::string(line.substr(start, i - start)), false});
    }
    return tokens;
}

class Parser {
public:
    Problem parse(std::string_view text) {
        size_t line_no = 0;
        size_t pos = 0;
        while (pos <= text.size()) {
            size_t eol = text.find('\n', pos);
            if (eol == std::string_view::npos) {
                eol = text.size();
            }
            ++line_no;
            parse_line(tokenize(text.substr(pos, eol - pos), line_no), line_no);
            pos = eol + 1;
        }

        if (problem_.num_points() == 0) {
            throw ProblemLoadError(0, "problem declares no points");
        }
        return std::move(problem_);
    }

private:
    Problem problem_;

    void parse_line(const std::vector<Token>& tokens, size_t line_no) {
        if (tokens.empty()) {
            return;
        }
        const Token& keyword = tokens[0];
        if (keyword.quoted) {
            throw ProblemLoadError(line_no, "expected a keyword, found a label");
        }

        if (keyword.text == "flag") {
            parse_flag(tokens, line_no);
        } else if (keyword.text == "point") {
            expect_count(tokens, 2, line_no);
            const std::string& name = plain(tokens[1], line_no);
            if (problem_.find_point(name)) {
                throw ProblemLoadError(line_no, "duplicate point '" + name + "'");
            }
            problem_.add_point(name);
        } else if (keyword.text == "distance") {
            expect_count(tokens, 4, line_no);
            Rule rule;
            rule.type = RuleType::Distance;
            rule.points[0] = point_ref(tokens[1], line_no);
            rule.points[1] = point_ref(tokens[2], line_no);
            rule.value = real(tokens[3], line_no);
            if (rule.value <= 0.0) {
                throw ProblemLoadError(line_no, "distance must be positive");
            }
            problem_.add_rule(rule);
        } else if (keyword.text == "angle") {
            expect_count(tokens, 5, line_no);
            Rule rule;
            rule.type = RuleType::Angle;
            for (size_t i = 0; i < 3; ++i) {
                rule.points[i] = point_ref(tokens[i + 1], line_no);
            }
            double degrees = real(tokens[4], line_no);
            if (degrees < 0.0 || degrees > 180.0) {
                throw ProblemLoadError(line_no, "angle must be within [0, 180] degrees");
            }
            rule.value = degrees * PI / 180.0;
            problem_.add_rule(rule);
        } else if (keyword.text == "collinear") {
            add_point_rule(RuleType::Collinear, tokens, line_no);
        } else if (keyword.text == "parallel") {
            add_point_rule(RuleType::Parallel, tokens, line_no);
        } else if (keyword.text == "perpendicular") {
            add_point_rule(RuleType::Perpendicular, tokens, line_no);
        } else if (keyword.text == "on_circle") {
            add_point_rule(RuleType::OnCircle, tokens, line_no);
        } else if (keyword.text == "draw") {
            parse_draw(tokens, line_no);
        } else {
            throw ProblemLoadError(line_no, "unknown keyword '" + keyword.text + "'");
        }
    }

    void parse_flag(const std::vector<Token>& tokens, size_t line_no) {
        expect_count(tokens, 3, line_no);
        const std::string& name = plain(tokens[1], line_no);
        const std::string& value = plain(tokens[2], line_no);
        GenerationFlags& flags = problem_.flags();

        if (name == "seed") {
            auto seed = parse_unsigned(value);
            if (!seed) {
                throw ProblemLoadError(line_no, "seed must be a non-negative integer");
            }
            flags.seed = *seed;
        } else if (name == "point_bounds" || name == "display_dots") {
            auto on = parse_switch(value);
            if (!on) {
                throw ProblemLoadError(line_no, "flag '" + name + "' expects on/off");
            }
            (name == "point_bounds" ? flags.point_bounds : flags.display_dots) = *on;
        } else if (name == "margin") {
            double margin = real(tokens[2], line_no);
            if (margin < 0.0 || margin >= 0.5) {
                throw ProblemLoadError(line_no, "margin must be within [0, 0.5)");
            }
            flags.margin = margin;
        } else if (name == "label_size") {
            double size = real(tokens[2], line_no);
            if (size <= 0.0) {
                throw ProblemLoadError(line_no, "label_size must be positive");
            }
            flags.label_size = size;
        } else {
            throw ProblemLoadError(line_no, "unknown flag '" + name + "'");
        }
    }

    void parse_draw(const std::vector<Token>& tokens, size_t line_no) {
        if (tokens.size() < 3) {
            throw ProblemLoadError(line_no, "draw expects a kind and its points");
        }
        const std::string& kind = plain(tokens[1], line_no);

        Directive directive;
        size_t n_points = 2;
        bool label_required = false;
        if (kind == "point") {
            directive.kind = DirectiveKind::Point;
            n_points = 1;
        } else if (kind == "label") {
            directive.kind = DirectiveKind::Point;
            directive.display_dot = false;
            n_points = 1;
            label_required = true;
        } else if (kind == "line") {
            directive.kind = DirectiveKind::Line;
        } else if (kind == "segment") {
            directive.kind = DirectiveKind::Segment;
        } else if (kind == "ray") {
            directive.kind = DirectiveKind::Ray;
        } else if (kind == "circle") {
            directive.kind = DirectiveKind::Circle;
        } else {
            throw ProblemLoadError(line_no, "unknown draw kind '" + kind + "'");
        }

        size_t expected = 2 + n_points;
        if (tokens.size() == expected + 1) {
            if (!tokens.back().quoted) {
                throw ProblemLoadError(line_no, "draw " + kind + ": label must be quoted");
            }
            directive.label = Label{tokens.back().text};
        } else if (tokens.size() != expected || label_required) {
            throw ProblemLoadError(line_no, "draw " + kind + ": wrong number of arguments");
        }

        for (size_t i = 0; i < n_points; ++i) {
            directive.points.push_back(point_ref(tokens[2 + i], line_no));
        }
        problem_.figure().directives.push_back(std::move(directive));
    }

    void add_point_rule(RuleType type, const std::vector<Token>& tokens, size_t line_no) {
        size_t arity = Rule::rule_arity(type);
        expect_count(tokens, arity + 1, line_no);
        Rule rule;
        rule.type = type;
        for (size_t i = 0; i < arity; ++i) {
            rule.points[i] = point_ref(tokens[i + 1], line_no);
        }
        problem_.add_rule(rule);
    }

    static void expect_count(const std::vector<Token>& tokens, size_t count, size_t line_no) {
        if (tokens.size() != count) {
            throw ProblemLoadError(line_no, "'" + tokens[0].text + "' expects " +
                                   std::to_string(count - 1) + " arguments");
        }
    }

    static const std::string& plain(const Token& token, size_t line_no) {
        if (token.quoted) {
            throw ProblemLoadError(line_no, "unexpected label \"" + token.text + "\"");
        }
        return token.text;
    }

    size_t point_ref(const Token& token, size_t line_no) const {
        auto idx = problem_.find_point(plain(token, line_no));
        if (!idx) {
            throw ProblemLoadError(line_no, "unknown point '" + token.text + "'");
        }
        return *idx;
    }

    static double real(const Token& token, size_t line_no) {
        auto value = parse_real(plain(token, line_no));
        if (!value) {
            throw ProblemLoadError(line_no, "invalid number '" + token.text + "'");
        }
        return *value;
    }
};

}  // namespace

Problem load_problem(std::string_view text) {
    Parser parser;
    return parser.parse(text);
}

Problem load_problem_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ProblemLoadError(0, "failed to open " + path.string());
    }
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        throw ProblemLoadError(0, "failed to read " + path.string());
    }
    return load_problem(content.str());
}

}  // namespace geo_debugger
