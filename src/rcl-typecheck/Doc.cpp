#include "Doc.hpp"

using namespace rcl::typecheck::pprint;

Doc Doc::concat(std::vector<Doc> parts)
{
    Doc doc(Kind::Concat);
    for (auto &part : parts) doc += std::move(part);
    return doc;
}

Doc Doc::indent(Doc inner)
{
    Doc doc(Kind::Indent);
    doc._children.push_back(std::move(inner));
    return doc;
}

bool Doc::empty() const
{
    switch (_kind) {
    case Kind::Text: return _text.empty();
    case Kind::HardBreak: return false;
    case Kind::Concat:
    case Kind::Indent:
        for (auto &child : _children) {
            if (not child.empty()) return false;
        }
        return true;
    }
    return true;
}

Doc &Doc::operator+=(Doc other)
{
    if (_kind != Kind::Concat) {
        Doc self = std::move(*this);
        *this = Doc(Kind::Concat);
        _children.push_back(std::move(self));
    }
    // Flatten nested concatenations so deep documents stay shallow.
    if (other._kind == Kind::Concat) {
        for (auto &child : other._children) _children.push_back(std::move(child));
    } else {
        _children.push_back(std::move(other));
    }
    return *this;
}

void Doc::render(std::string &out, int indent, bool &at_line_start) const
{
    switch (_kind) {
    case Kind::Text:
        if (_text.empty()) return;
        if (at_line_start) {
            out.append(indent, ' ');
            at_line_start = false;
        }
        out += _text;
        return;
    case Kind::HardBreak:
        out += '\n';
        at_line_start = true;
        return;
    case Kind::Concat:
        for (auto &child : _children) child.render(out, indent, at_line_start);
        return;
    case Kind::Indent:
        for (auto &child : _children) child.render(out, indent + INDENT_WIDTH, at_line_start);
        return;
    }
}

std::string Doc::to_string() const
{
    std::string out;
    bool at_line_start = true;
    render(out, 0, at_line_start);
    return out;
}
