#include <algorithm>
#include <cctype>
#include <parexec/config_file.hh>
#include <parexec/file_manip.hh>

using std::string;

namespace {

constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

// Checks whether c is a white-space but not a newline
constexpr bool is_ws(char c) noexcept { return c != '\n' && is_space(c); }

// Checks whether character is one of these [a-zA-Z0-9\-_.]
bool is_name(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
}

constexpr char dec2hex(int x) noexcept { return static_cast<char>(x > 9 ? 'a' - 10 + x : x + '0'); }

int hex2dec(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    return std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
}

} // namespace

const ConfigFile::Variable ConfigFile::null_var{};

void ConfigFile::load_config_from_file(const string& pathname, bool load_all) {
    load_config_from_string(get_file_contents(pathname), load_all);
}

void ConfigFile::load_config_from_string(string config, bool load_all) {
    // Set all variables as unused
    for (auto& it : vars) {
        it.second.unset();
    }

    config += '\n'; // Now each line ends with a newline character
    size_t pos = 0; // Current position in config

    auto throw_parse_error = [&](auto&&... args) {
        auto err_pos = std::min(pos, config.size() - 1);
        size_t line_beg = err_pos; // Beginning of the line containing err_pos
        while (line_beg > 0 and config[line_beg - 1] != '\n') {
            --line_beg;
        }

        auto line = 1 + std::count(config.begin(), config.begin() + line_beg, '\n');
        size_t col = err_pos - line_beg + 1; // Indexed from 1

        ParseError pe(line, col, std::forward<decltype(args)>(args)...);

        // Construct diagnostics
        auto& diags = pe.diagnostics_;
        auto append_char = [&](unsigned char c) {
            if (std::isprint(c)) {
                diags += static_cast<char>(c);
            } else {
                diags += "\\x";
                diags += dec2hex(c >> 4);
                diags += dec2hex(c & 15);
            }
        };

        for (size_t k = line_beg; k < err_pos; ++k) {
            append_char(config[k]);
        }
        size_t padding = diags.size();
        for (size_t k = err_pos; config[k] != '\n'; ++k) {
            append_char(config[k]);
        }
        // Diagnostics's second line - stress
        diags += '\n';
        diags.append(padding, ' ');
        diags += '^';

        throw std::move(pe);
    };

    auto skip_comment = [&] {
        while (config[pos] != '\n') {
            ++pos;
        }
    };

    auto extract_value = [&](bool is_in_array) {
        string res;
        // Single-quoted string
        if (config[pos] == '\'') {
            while (config[++pos] != '\n') {
                if (config[pos] == '\'') {
                    // Safe (newline is at the end of every line)
                    if (config[pos + 1] != '\'') {
                        ++pos;
                        return res;
                    }
                    ++pos;
                }
                res += config[pos];
            }
            throw_parse_error("Missing terminating ' character");
        }

        // Double-quoted string
        if (config[pos] == '"') {
            while (config[++pos] != '\n') {
                if (config[pos] == '"') {
                    ++pos;
                    return res;
                }

                if (config[pos] != '\\') {
                    res += config[pos];
                    continue;
                }

                // Escape sequence
                switch (config[++pos]) {
                case '\'': res += '\''; continue;
                case '"': res += '"'; continue;
                case '?': res += '?'; continue;
                case '\\': res += '\\'; continue;
                case 't': res += '\t'; continue;
                case 'a': res += '\a'; continue;
                case 'b': res += '\b'; continue;
                case 'f': res += '\f'; continue;
                case 'n': res += '\n'; continue;
                case 'r': res += '\r'; continue;
                case 'v': res += '\v'; continue;
                case 'x':
                    // pos will not go out of the buffer - (guard = newline)
                    if (!std::isxdigit(static_cast<unsigned char>(config[++pos]))) {
                        throw_parse_error("Invalid hexadecimal digit: `", config[pos], '`');
                    }
                    if (!std::isxdigit(static_cast<unsigned char>(config[++pos]))) {
                        throw_parse_error("Invalid hexadecimal digit: `", config[pos], '`');
                    }
                    res += static_cast<char>(
                        (hex2dec(config[pos - 1]) << 4) + hex2dec(config[pos])
                    );
                    continue;
                default: throw_parse_error("Unknown escape sequence: `\\", config[pos], '`');
                }
            }
            throw_parse_error("Missing terminating \" character");
        }

        // String literal
        if (config[pos] == '[' or (is_in_array and (config[pos] == ',' or config[pos] == ']'))) {
            throw_parse_error("Invalid beginning of the string literal: `", config[pos], '`');
        }

        size_t end = pos;
        if (is_in_array) { // Value in an array
            while (config[end] != '\n' and config[end] != '#' and config[end] != ']' and
                   config[end] != ',')
            {
                ++end;
            }
        } else { // Value of an ordinary variable
            while (config[end] != '\n' and config[end] != '#') {
                ++end;
            }
        }

        size_t val_end = end;
        // Remove white-spaces from ending
        while (val_end > pos and is_space(config[val_end - 1])) {
            --val_end;
        }
        res.assign(config, pos, val_end - pos);
        pos = end;
        return res;
    };

    Variable tmp; // Used for ignored variables
    while (pos < config.size()) {
        while (is_ws(config[pos])) {
            ++pos;
        }
        // Newline
        if (config[pos] == '\n') {
            ++pos;
            continue;
        }
        // Comment
        if (config[pos] == '#') {
            skip_comment();
            ++pos;
            continue;
        }

        /* Variable name */
        size_t name_beg = pos;
        while (is_name(config[pos])) {
            ++pos;
        }
        string name = config.substr(name_beg, pos - name_beg);
        if (name.empty()) {
            throw_parse_error("Invalid or missing variable's name");
        }

        /* Assignment operator */
        while (is_ws(config[pos])) {
            ++pos;
        }
        if (config[pos] == '\n' or config[pos] == '#') { // Newline or comment
            throw_parse_error("Incomplete directive: `", name, '`');
        }
        if (config[pos] != '=' and config[pos] != ':') {
            throw_parse_error("Invalid assignment operator: `", config[pos], '`');
        }

        ++pos; // Assignment operator
        while (is_ws(config[pos])) {
            ++pos;
        }

        /* Value */
        Variable* varp = nullptr; // It is safe to take a pointer to a value in
                                  // vars, as vars is not modified after that
        if (load_all) {
            varp = &vars[name];
        } else {
            auto it = vars.find(name);
            varp = (it != vars.end() ? &it->second : &tmp);
        }
        Variable& var = *varp;
        var.unset();
        var.flag_ = Variable::SET;

        if (config[pos] != '[') { // Normal
            if (config[pos] != '\n' and config[pos] != '#') {
                var.str_ = extract_value(false);
            }
        } else { // Array
            var.flag_ |= Variable::ARRAY;
            ++pos; // Skip [

            for (;;) {
                while (pos < config.size() and is_space(config[pos])) {
                    ++pos;
                }
                if (pos >= config.size()) {
                    throw_parse_error("Missing terminating ] character at the end of an array");
                }

                if (config[pos] == ']') { // End of the array
                    ++pos;
                    break;
                }
                if (config[pos] == '#') { // Comment
                    skip_comment();
                    continue;
                }
                // Ignore extra delimiters
                if (config[pos] == ',') {
                    ++pos;
                    continue;
                }

                // Value
                var.arr_.emplace_back(extract_value(true));

                while (is_ws(config[pos])) {
                    ++pos;
                }
                // Delimiter
                if (config[pos] == ',' or config[pos] == '\n') {
                    ++pos;
                    continue;
                }
                // Comment
                if (config[pos] == '#') {
                    skip_comment();
                    continue;
                }
                // End of the array
                if (config[pos] == ']') {
                    ++pos;
                    break;
                }

                throw_parse_error("Invalid sequence after the array value: `", config[pos], '`');
            }
        }

        // Only white-spaces and comments may follow the value
        while (is_ws(config[pos])) {
            ++pos;
        }
        if (config[pos] == '#') {
            skip_comment();
        }
        if (config[pos] != '\n') {
            throw_parse_error("Invalid sequence after the value: `", config[pos], '`');
        }
        ++pos;
    }
}
