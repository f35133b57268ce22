#include "lexlit/diagnostics_json.hpp"
#include "lexlit/env.hpp"
#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>

namespace lexlit {

std::string json_escape(std::string_view s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string error_to_json(const scan_state& st){
    if(!st.error.set) return "{\"success\":true}";
    line_col lc = locate(st.input, st.error.pos);
    std::ostringstream os;
    os<<"{\"success\":false"
      <<",\"expected\":"<<json_escape(st.error.expected)
      <<",\"pos\":"<<st.error.pos
      <<",\"line\":"<<lc.line
      <<",\"col\":"<<lc.col
      <<"}";
    return os.str();
}

std::string node_to_json(const literal_node& n){
    std::ostringstream os;
    os<<"{";
    if(auto *t = as_text(n)){
        os<<"\"kind\":\"text\",\"text\":"<<json_escape(t->view())<<",\"borrowed\":"<<(t->borrowed()?"true":"false");
    } else if(auto i = as_int(n)){
        os<<"\"kind\":\"integer\",\"value\":"<<*i;
    } else if(auto d = as_float(n)){
        os<<"\"kind\":\"float\",\"value\":"<<std::setprecision(std::numeric_limits<double>::max_digits10)<<*d;
    } else if(auto *c = as_children(n)){
        os<<"\"kind\":\"compound\",\"children\":[";
        for(size_t i=0;i<c->size(); ++i){ if(i) os<<","; os<<node_to_json((*c)[i]); }
        os<<"]";
    } else {
        os<<"\"kind\":\"empty\"";
    }
    os<<",\"start\":"<<n.start<<",\"end\":"<<n.end<<"}";
    return os.str();
}

void maybe_print_json(const scan_state& st){
    if(!detect_env().diagJson) return;
    auto js=error_to_json(st);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace lexlit
