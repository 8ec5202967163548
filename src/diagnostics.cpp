#include "cook/diagnostics.hpp"
#include <algorithm>

namespace cook {

DiagnosticReport DiagnosticReport::from_queue(DiagnosticQueue& q){
    DiagnosticReport r;
    while(!q.empty()){ r.push(std::move(q.front())); q.pop_front(); }
    return r;
}

LineCol line_col(std::string_view src, size_t offset){
    LineCol lc;
    offset = std::min(offset, src.size());
    for(size_t i=0;i<offset;++i){
        if(src[i]=='\n'){ ++lc.line; lc.col=1; } else ++lc.col;
    }
    return lc;
}

std::string format_diagnostic(const Diagnostic& d, std::string_view src){
    LineCol lc = line_col(src, d.primary_span().start);
    std::string out = std::to_string(lc.line) + ":" + std::to_string(lc.col) + ": ";
    out += d.is_error() ? "error" : "warning";
    out += "[" + d.code + "]: " + d.message;
    for(const auto& l : d.labels){
        if(l.text.empty()) continue;
        LineCol at = line_col(src, l.span.start);
        out += "\n  --> " + std::to_string(at.line) + ":" + std::to_string(at.col) + ": " + l.text;
    }
    for(const auto& h : d.hints) out += "\n  hint: " + h;
    for(const auto& n : d.notes) out += "\n  note: " + n;
    return out;
}

int edit_distance(const std::string& a, const std::string& b){
    size_t n=a.size(), m=b.size();
    if(n>64||m>64){ // cap to avoid large allocs; simple fallback
        int dist=0; for(size_t i=0;i<std::min(n,m);++i) if(a[i]!=b[i]) ++dist;
        return dist + (int)std::max(n,m) - (int)std::min(n,m);
    }
    int dp[65][65];
    for(size_t i=0;i<=n;++i) dp[i][0]=(int)i;
    for(size_t j=0;j<=m;++j) dp[0][j]=(int)j;
    for(size_t i=1;i<=n;++i){ for(size_t j=1;j<=m;++j){ int c = a[i-1]==b[j-1]?0:1; dp[i][j]=std::min({dp[i-1][j]+1, dp[i][j-1]+1, dp[i-1][j-1]+c}); } }
    return dp[n][m];
}

std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist){
    std::vector<std::string> out;
    for(auto &c: pool){
        if(c.empty() || c==target) continue;
        if(std::find(out.begin(), out.end(), c)!=out.end()) continue;
        if(edit_distance(target,c)<=maxDist) out.push_back(c);
    }
    if(out.size()>5) out.resize(5);
    return out;
}

void append_suggestions(Diagnostic& d, const std::vector<std::string>& suggs, bool enabled){
    if(!enabled || suggs.empty()) return;
    std::string msg="did you mean ";
    for(size_t i=0;i<suggs.size();++i){ msg+="'"+suggs[i]+"'"; if(i+1<suggs.size()) msg+= i+2==suggs.size()?" or ":", "; }
    d.note(msg + "?");
}

} // namespace cook
