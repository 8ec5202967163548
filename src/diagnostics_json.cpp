#include "cook/diagnostics_json.hpp"
#include <sstream>
#include <cstdlib>
#include <cstdio>

namespace cook {

std::string json_escape(const std::string& s){
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

static void append_strings_json(std::ostringstream& os, const std::vector<std::string>& xs){
    os<<"[";
    for(size_t i=0;i<xs.size(); ++i){ if(i) os<<","; os<<json_escape(xs[i]); }
    os<<"]";
}

static void append_labels_json(std::ostringstream& os, const std::vector<Label>& labels, std::string_view src){
    os<<"[";
    for(size_t i=0;i<labels.size(); ++i){
        if(i) os<<",";
        LineCol lc = line_col(src, labels[i].span.start);
        os<<"{\"start\":"<<labels[i].span.start
          <<",\"end\":"<<labels[i].span.end
          <<",\"line\":"<<lc.line
          <<",\"col\":"<<lc.col
          <<",\"text\":"<<json_escape(labels[i].text)
          <<"}";
    }
    os<<"]";
}

static void append_diagnostics_json(std::ostringstream& os, const std::vector<Diagnostic>& ds, std::string_view src){
    os<<"[";
    for(size_t i=0;i<ds.size(); ++i){
        const auto &d=ds[i]; if(i) os<<",";
        LineCol lc = line_col(src, d.primary_span().start);
        os<<"{"
            "\"code\":"<<json_escape(d.code)
            <<",\"message\":"<<json_escape(d.message)
            <<",\"line\":"<<lc.line
            <<",\"col\":"<<lc.col
            <<",\"labels\":";
        append_labels_json(os,d.labels,src);
        os<<",\"hints\":";
        append_strings_json(os,d.hints);
        os<<",\"notes\":";
        append_strings_json(os,d.notes);
        os<<"}";
    }
    os<<"]";
}

std::string diagnostics_to_json(const DiagnosticReport& r, std::string_view src){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.has_errors()?"false":"true")<<",\"errors\":";
    append_diagnostics_json(os,r.errors,src);
    os<<",\"warnings\":";
    append_diagnostics_json(os,r.warnings,src);
    os<<"}";
    return os.str();
}

void maybe_print_json(const DiagnosticReport& r, std::string_view src){
    if(const char* env = std::getenv("COOK_DIAG_JSON")){
        if(env[0]=='1'){
            auto js=diagnostics_to_json(r,src);
            std::fprintf(stderr, "%s\n", js.c_str());
        }
    }
}

} // namespace cook
