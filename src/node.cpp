#include "lexlit/node.hpp"
#include "lexlit/escapes.hpp"

#include <sstream>

namespace lexlit
{

    std::string to_string(const literal_node &n)
    {
        struct V
        {
            std::string operator()(std::monostate) const { return "<empty>"; }
            std::string operator()(const token_text &t) const { return '"' + escape_text(t.view(), U'"') + '"'; }
            std::string operator()(int64_t i) const { return std::to_string(i); }
            std::string operator()(double d) const
            {
                std::ostringstream oss;
                oss << d;
                return oss.str();
            }
            std::string operator()(const literal_children &c) const
            {
                std::string out = "[";
                bool first = true;
                for (auto &ch : c)
                {
                    if (!first)
                        out += ' ';
                    first = false;
                    if (auto *t = as_text(ch))
                        out += '/' + escape_text(t->view(), U'/') + '/';
                    else
                        out += to_string(ch);
                }
                out += ']';
                return out;
            }
        };
        return std::visit(V{}, n.value);
    }

} // namespace lexlit
