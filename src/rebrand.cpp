#include "rebrand.hpp"
#include "util.hpp"
#include <cctype>

namespace chitin {

namespace {

bool is_name_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '-' || c == '.' || c == '/' || c == '@';
}

// "<banner> <version>...", optionally behind a leading emoji
// ("🦞 OpenClaw 2026.2.1 (3f2a1c0) ...").
bool is_banner_line(const std::string& line, const std::string& banner) {
    size_t i = 0;
    while (i < line.size() && static_cast<unsigned char>(line[i]) >= 0x80) ++i;
    while (i < line.size() && line[i] == ' ') ++i;
    if (line.compare(i, banner.size(), banner) != 0) return false;
    i += banner.size();
    return i + 1 < line.size() && line[i] == ' ' &&
           std::isdigit(static_cast<unsigned char>(line[i + 1]));
}

} // namespace

std::string replace_brand_tokens(const std::string& line,
                                 const std::string& from,
                                 const std::string& to) {
    if (from.empty()) return line;
    std::string out;
    out.reserve(line.size());
    size_t pos = 0;
    while (pos < line.size()) {
        size_t hit = line.find(from, pos);
        if (hit == std::string::npos) break;
        size_t end = hit + from.size();
        bool left_ok = hit == 0 || !is_name_char(line[hit - 1]);
        bool right_ok = end >= line.size() || !is_name_char(line[end]);
        out.append(line, pos, hit - pos);
        if (left_ok && right_ok) {
            out += to;
        } else {
            out.append(line, hit, from.size());
        }
        pos = end;
    }
    out.append(line, pos, std::string::npos);
    return out;
}

LineRebrander::LineRebrander(RebrandContext ctx, Sink sink)
    : ctx_(std::move(ctx)), sink_(std::move(sink)) {}

void LineRebrander::feed(const char* data, size_t len) {
    pending_.append(data, len);
    size_t start = 0;
    size_t nl;
    while ((nl = pending_.find('\n', start)) != std::string::npos) {
        emit(rebrand_line(pending_.substr(start, nl - start)) + "\n");
        start = nl + 1;
    }
    pending_.erase(0, start);
}

void LineRebrander::finish() {
    if (pending_.empty()) return;
    emit(rebrand_line(pending_));
    pending_.clear();
}

void LineRebrander::emit(const std::string& text) {
    output_ += text;
    if (sink_) sink_(text);
}

std::string LineRebrander::rebranded_banner() const {
    std::string banner = ctx_.brand.to + " " + ctx_.wrapper_version;
    if (!ctx_.wrapped_version.empty()) {
        banner += " (" + ctx_.brand.from + " " + ctx_.wrapped_version + ")";
    }
    return banner;
}

std::string LineRebrander::rebrand_line(const std::string& line) {
    const auto& brand = ctx_.brand;

    if (is_banner_line(line, brand.banner)) {
        std::string banner = rebranded_banner();
        // Keep CRLF line endings intact
        if (!line.empty() && line.back() == '\r') banner += '\r';
        return banner;
    }
    // Output of the rule above, wherever it appears
    std::string bare = (!line.empty() && line.back() == '\r') ? line.substr(0, line.size() - 1)
                                                              : line;
    if (bare == rebranded_banner()) {
        return line;
    }
    if (starts_with(line, "Usage:")) {
        return replace_brand_tokens(line, brand.from, brand.to);
    }
    if (starts_with(line, "Examples:")) {
        in_examples_ = true;
        return line;
    }
    if (starts_with(line, "Docs:")) {
        in_examples_ = false;
        return line;
    }
    if (in_examples_) {
        return replace_brand_tokens(line, brand.from, brand.to);
    }
    return line;
}

std::string rebrand_help(const std::string& text, const RebrandContext& ctx) {
    LineRebrander rebrander(ctx);
    rebrander.feed(text);
    rebrander.finish();
    return rebrander.output();
}

} // namespace chitin
