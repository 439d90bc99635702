#include "keel/Keelfile.hpp"
#include "keel/Errors.hpp"

#include <cctype>
#include <fstream>
#include <regex>

using namespace keel;
namespace fs = std::filesystem;

// ------------ Helpers ------------
std::string KeelParser::trim(const std::string &x) {
    auto start = x.begin();
    while (start != x.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto rend = x.rbegin();
    while (rend != x.rend() && rend.base() != start && std::isspace(static_cast<unsigned char>(*rend))) {
        ++rend;
    }
    return std::string(start, rend.base());
}

bool KeelParser::starts_with(const std::string &s, const std::string &p) {
    return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}

bool KeelParser::is_directive(const std::string &s, const std::string &name) {
    if (!starts_with(s, name)) return false;
    return s.size() == name.size() || std::isspace(static_cast<unsigned char>(s[name.size()])) ||
           s[name.size()] == '[';
}

// "a b", "a, b" or "[a, b]"
std::vector<std::string> KeelParser::split_names(const std::string &src) {
    std::string t = trim(src);
    if (!t.empty() && t.front() == '[' && t.back() == ']') t = t.substr(1, t.size() - 2);
    std::vector<std::string> out;
    std::string cur;
    for (const char c: t) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) out.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(std::move(cur));
    return out;
}

std::string KeelParser::strip_quotes(std::string x) {
    x = trim(x);
    if (x.size() >= 2) {
        const char a = x.front(), b = x.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            x = x.substr(1, x.size() - 2);
        }
    }
    return x;
}

bool KeelParser::valid_name(const std::string &name) {
    static const std::regex re(R"([A-Za-z0-9_.][A-Za-z0-9_./-]*)");
    return std::regex_match(name, re);
}

std::pair<std::string, std::string> KeelParser::split_assignment(const std::string &rest, const char *directive) const {
    // The name ends at the first '=' or blank; a '=' inside the value is kept.
    size_t i = 0;
    while (i < rest.size() && rest[i] != '=' && !std::isspace(static_cast<unsigned char>(rest[i]))) ++i;
    const std::string name = rest.substr(0, i);
    while (i < rest.size() && std::isspace(static_cast<unsigned char>(rest[i]))) ++i;
    if (i < rest.size() && rest[i] == '=') ++i;
    const std::string value = strip_quotes(rest.substr(i));

    static const std::regex nameRe(R"([A-Za-z_][A-Za-z0-9_]*)");
    if (!std::regex_match(name, nameRe)) {
        bad(std::string(directive) + ": " + _("invalid variable name") + " '" + name + "'");
    }
    return {name, value};
}

// Variables an @release block defines.
static bool release_variable(const std::string &name) {
    return name == "TAG" || name == "REMOTE" || name == "ARTIFACT";
}

void KeelParser::check_not_release_variable(const std::string &name) const {
    if (release_variable(name) && (project_.release || current_release_)) {
        bad(std::string(_("variable is defined by @release")) + ": " + name);
    }
}

// ------------ Core ------------

KeelParser::KeelParser() = default;

[[noreturn]] void KeelParser::bad(const std::string &msg) const {
    const std::string file = file_stack.empty() ? std::string("<input>") : file_stack.back().string();
    throw ParseError(file, currentLine, msg);
}

std::string KeelParser::expand_literals(const std::string &in, const int depth) const {
    if (depth > include_depth_max) bad(_("variable nesting too deep"));
    static const std::regex re(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\})");
    std::string out;
    out.reserve(in.size());
    std::sregex_iterator it(in.begin(), in.end(), re);
    size_t last = 0;
    for (const std::sregex_iterator end; it != end; ++it) {
        const auto &m = *it;
        out.append(in, last, static_cast<size_t>(m.position()) - last);
        const std::string key = m[1].str();
        const auto itv = literals_.find(key);
        if (itv == literals_.end()) bad(std::string(_("unknown variable in path")) + ": " + key);
        out += expand_literals(itv->second, depth + 1);
        last = static_cast<size_t>(m.position() + m.length());
    }
    out.append(in, last, std::string::npos);
    return out;
}

void KeelParser::parse_file(const std::string &path) {
    fs::path p = fs::absolute(path);
    if (include_depth >= include_depth_max) bad(_("include depth exceeded"));
    if (!fs::exists(p)) bad(std::string(_("failed to open file")) + ": " + p.string());

    std::string key = p.lexically_normal().string();
    if (include_guard.contains(key)) {
        bad(std::string(_("circular include detected")) + ": " + key);
    }

    std::ifstream in(p);
    if (!in.is_open()) bad(std::string(_("failed to open file")) + ": " + p.string());

    // RAII guard for the include stack; restores the includer's line number too
    struct IncludeGuardRAII {
        KeelParser *self;
        std::string key;
        int saved_line;

        IncludeGuardRAII(KeelParser *s, std::string k, fs::path pth)
            : self(s), key(std::move(k)), saved_line(s->currentLine) {
            self->include_guard.insert(key);
            self->file_stack.push_back(std::move(pth));
            self->include_depth++;
        }

        ~IncludeGuardRAII() {
            self->include_guard.erase(key);
            if (!self->file_stack.empty()) self->file_stack.pop_back();
            self->include_depth--;
            self->currentLine = saved_line;
        }
    } guard(this, key, p);
    project_.files.push_back(key);

    std::string line;
    std::string pending;
    int physical = 0;
    int start_line = 0;
    while (std::getline(in, line)) {
        ++physical;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (pending.empty()) start_line = physical;

        // Trailing backslash joins the next line
        if (!line.empty() && line.back() == '\\') {
            line.pop_back();
            pending += pending.empty() ? line : " " + trim(line);
            continue;
        }
        pending += pending.empty() ? line : " " + trim(line);
        currentLine = start_line;
        const std::string s = trim(pending);
        pending.clear();
        if (s.empty() || starts_with(s, "#") || starts_with(s, "//")) continue;
        parse_line(s);
    }
    if (!pending.empty()) {
        currentLine = start_line;
        bad(_("line continuation at end of file"));
    }
}

void KeelParser::parse_line(const std::string &line) {
    const std::string s = trim(line);
    if (s.empty()) return;
    if (starts_with(s, "#") || starts_with(s, "//")) return;

    if (current_target_) {
        parse_target_line(s);
        return;
    }
    if (current_release_) {
        parse_release_line(s);
        return;
    }

    if (is_directive(s, "@include")) {
        std::string rest = trim(s.substr(std::string("@include").size()));
        if (rest.empty()) bad(_("@include expects a path"));

        // strip quotes, expand ${VAR}, strip again in case the expansion added quotes
        rest = strip_quotes(rest);
        rest = expand_literals(rest);
        rest = strip_quotes(rest);

        // relative to the including file; fallback = cwd
        const fs::path base = file_stack.empty() ? fs::current_path() : file_stack.back().parent_path();
        const fs::path target = fs::absolute(base / rest);
        if (!fs::exists(target)) {
            bad(std::string(_("@include file not found")) + ": " + target.string());
        }
        parse_file(target.string());
        return;
    }

    // ----- variables -----
    if (is_directive(s, "@let")) {
        const std::string rest = trim(s.substr(std::string("@let").size()));
        if (rest.empty()) bad(_("@let expects NAME=VALUE"));
        auto [name, value] = split_assignment(rest, "@let");
        check_not_release_variable(name);
        literals_[name] = value;
        project_.variables.push_back(Variable::literal(name, value));
        return;
    }
    if (is_directive(s, "@capture")) {
        const std::string rest = trim(s.substr(std::string("@capture").size()));
        if (rest.empty()) bad(_("@capture expects NAME=COMMAND"));
        auto [name, command] = split_assignment(rest, "@capture");
        check_not_release_variable(name);
        if (command.empty()) bad(_("@capture expects a command"));
        literals_.erase(name);
        project_.variables.push_back(Variable::capture(name, command));
        return;
    }
    if (is_directive(s, "@export")) {
        const std::string rest = trim(s.substr(std::string("@export").size()));
        if (rest.empty()) bad(_("@export expects a variable name"));
        if (rest.find('=') != std::string::npos) {
            auto [name, value] = split_assignment(rest, "@export");
            check_not_release_variable(name);
            literals_[name] = value;
            Variable v = Variable::literal(name, value);
            v.exported = true;
            project_.variables.push_back(std::move(v));
            return;
        }
        for (const auto &name: split_names(rest)) {
            bool found = false;
            for (auto &v: project_.variables) {
                if (v.name == name) {
                    v.exported = true;
                    found = true;
                }
            }
            if (!found) bad(std::string(_("@export of undeclared variable")) + ": " + name);
        }
        return;
    }

    // ----- help and goals -----
    if (is_directive(s, "@default")) {
        const std::string rest = trim(s.substr(std::string("@default").size()));
        if (!valid_name(rest)) bad(_("@default expects a target name"));
        project_.default_goal = rest;
        return;
    }
    if (is_directive(s, "@section")) {
        const std::string rest = strip_quotes(s.substr(std::string("@section").size()));
        if (rest.empty()) bad(_("@section expects a title"));
        project_.registry.add_section(rest);
        return;
    }

    // ----- blocks -----
    if (is_directive(s, "@target")) {
        open_target(trim(s.substr(std::string("@target").size())));
        return;
    }
    if (is_directive(s, "@release")) {
        open_release(trim(s.substr(std::string("@release").size())));
        return;
    }
    if (is_directive(s, "@end")) bad(_("@end outside of a block"));
    if (is_directive(s, "@run") || is_directive(s, "@needs") || is_directive(s, "@desc")) {
        bad(std::string(_("used outside of @target")) + ": " + s);
    }
    bad(std::string(_("unknown directive")) + ": " + s);
}

void KeelParser::open_target(const std::string &rest) {
    if (rest.empty()) bad(_("@target expects a name"));
    size_t j = 0;
    while (j < rest.size() && !std::isspace(static_cast<unsigned char>(rest[j]))) ++j;
    Target t;
    t.name = rest.substr(0, j);
    if (!valid_name(t.name)) bad(std::string(_("invalid target name")) + ": " + t.name);
    const std::string attrs = rest.substr(j);

    // desc="..."
    {
        static const std::regex descRe(R"_K(\bdesc\s*=\s*\"([^\"]*)\")_K");
        std::smatch m;
        if (std::regex_search(attrs, m, descRe)) t.description = m[1].str();
    }
    // needs=[a, b]
    {
        static const std::regex needsRe(R"_K(\bneeds\s*=\s*\[([^\]]*)\])_K");
        std::smatch m;
        if (std::regex_search(attrs, m, needsRe)) t.prerequisites = split_names(m[1].str());
        else if (std::regex_search(attrs, std::regex(R"(\bneeds\s*=)"))) bad(_("needs= expects a [list]"));
    }
    current_target_ = std::move(t);
    mark_block();
}

void KeelParser::open_release(const std::string &rest) {
    ReleaseConfig cfg;
    size_t j = 0;
    while (j < rest.size() && !std::isspace(static_cast<unsigned char>(rest[j]))) ++j;
    if (j > 0) cfg.name = rest.substr(0, j);
    if (!valid_name(cfg.name)) bad(std::string(_("invalid target name")) + ": " + cfg.name);
    static const std::regex descRe(R"_K(\bdesc\s*=\s*\"([^\"]*)\")_K");
    std::smatch m;
    const std::string attrs = rest.substr(j);
    if (std::regex_search(attrs, m, descRe)) cfg.description = m[1].str();
    if (project_.release) bad(_("only one @release block is supported"));
    current_release_ = std::move(cfg);
    mark_block();
}

void KeelParser::parse_target_line(const std::string &s) {
    Target &t = *current_target_;
    if (is_directive(s, "@end")) {
        close_block();
        return;
    }
    if (is_directive(s, "@needs")) {
        for (auto &dep: split_names(s.substr(std::string("@needs").size()))) t.prerequisites.push_back(std::move(dep));
        return;
    }
    if (is_directive(s, "@desc")) {
        t.description = strip_quotes(s.substr(std::string("@desc").size()));
        return;
    }
    if (is_directive(s, "@run")) {
        std::string rest = trim(s.substr(std::string("@run").size()));
        Command cmd;
        // optional flags: @run [ignore,silent,raw] command
        if (!rest.empty() && rest.front() == '[') {
            const auto close = rest.find(']');
            if (close == std::string::npos) bad(_("missing closing ']' in @run flags"));
            for (const auto &flag: split_names(rest.substr(1, close - 1))) {
                if (flag == "ignore") cmd.suppress_failure = true;
                else if (flag == "silent") cmd.silent = true;
                else if (flag == "raw") cmd.expand = false;
                else bad(std::string(_("unknown @run flag")) + ": " + flag);
            }
            rest = trim(rest.substr(close + 1));
        }
        if (rest.empty()) bad(_("@run expects a command"));
        cmd.text = rest;
        t.commands.push_back(std::move(cmd));
        return;
    }
    bad(std::string(_("unexpected line in @target")) + " '" + t.name + "': " + s);
}

void KeelParser::parse_release_line(const std::string &s) {
    ReleaseConfig &cfg = *current_release_;
    if (is_directive(s, "@end")) {
        close_block();
        return;
    }
    const auto eq = s.find('=');
    if (eq == std::string::npos) bad(std::string(_("expected key = value in @release")) + ": " + s);
    const std::string key = trim(s.substr(0, eq));
    const std::string value = strip_quotes(s.substr(eq + 1));

    if (key == "needs") cfg.prerequisites = split_names(value);
    else if (key == "desc") cfg.description = value;
    else if (key == "version") cfg.version = value;
    else if (key == "tag") cfg.tag = value;
    else if (key == "vcs") cfg.vcs = value;
    else if (key == "remote") cfg.remote = value;
    else if (key == "package") cfg.package = value;
    else if (key == "artifact") cfg.artifact = value;
    else if (key == "validate") cfg.validate = value;
    else if (key == "publish") cfg.publish = value;
    else if (key == "upload") cfg.upload = value;
    else bad(std::string(_("unknown @release key")) + ": " + key);
}

void KeelParser::close_block() {
    if (current_target_) {
        Target t = std::move(*current_target_);
        current_target_.reset();
        project_.registry.add(std::move(t));
        return;
    }
    if (current_release_) {
        for (const auto &v: project_.variables) check_not_release_variable(v.name);
        ReleasePipeline pipeline(std::move(*current_release_));
        current_release_.reset();
        pipeline.install(project_.registry, project_.variables);
        literals_["TAG"] = pipeline.config().tag;
        literals_["REMOTE"] = pipeline.config().remote;
        literals_["ARTIFACT"] = pipeline.config().artifact;
        project_.release = std::move(pipeline);
    }
}

void KeelParser::mark_block() {
    block_file_ = file_stack.empty() ? std::string("<input>") : file_stack.back().string();
    block_line_ = currentLine;
}

void KeelParser::finalize() {
    // Reported at the line that opened the block.
    if (current_target_) {
        throw ParseError(block_file_, block_line_,
                         std::string(_("missing @end for target")) + " '" + current_target_->name + "'");
    }
    if (current_release_) {
        throw ParseError(block_file_, block_line_,
                         std::string(_("missing @end for release")) + " '" + current_release_->name + "'");
    }
}

Project keel::load_keelfile(const std::string &path) {
    KeelParser parser;
    parser.parse_file(path);
    parser.finalize();
    return parser.take();
}
