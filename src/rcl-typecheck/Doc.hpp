#pragma once
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace rcl::typecheck::pprint
{
    // A document to be rendered for humans. Only the few constructs that error
    // bodies need: text, forced line breaks, concatenation and indentation.
    class Doc {
    public:
        enum class Kind { Text, HardBreak, Concat, Indent };

        Doc() : Doc(Kind::Concat) { }
        Doc(const char *text) : Doc(std::string(text)) { }
        Doc(std::string text) : _kind(Kind::Text), _text(std::move(text)) { }

        static Doc hard_break() { return Doc(Kind::HardBreak); }
        static Doc concat(std::vector<Doc> parts);
        static Doc indent(Doc inner);

        Kind kind() const { return _kind; }
        bool empty() const;

        Doc &operator+=(Doc other);

        std::string to_string() const;

    private:
        explicit Doc(Kind kind) : _kind(kind) { }
        void render(std::string &out, int indent, bool &at_line_start) const;

        Kind _kind;
        std::string _text;
        std::vector<Doc> _children;
    };

    inline Doc operator+(Doc lhs, Doc rhs)
    {
        lhs += std::move(rhs);
        return lhs;
    }

    inline constexpr int INDENT_WIDTH = 2;

}
