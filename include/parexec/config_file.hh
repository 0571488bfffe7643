#pragma once

#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <parexec/concat_tostr.hh>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

class ConfigFile {
public:
    class ParseError : public std::runtime_error {
        std::string diagnostics_;

    public:
        explicit ParseError(const std::string& msg) : runtime_error(msg) {}

        template <class... Args>
        ParseError(size_t line, size_t pos, Args&&... msg)
        : runtime_error(concat_tostr("line ", line, ':', pos, ": ", std::forward<Args>(msg)...)) {}

        ParseError(const ParseError& pe) = default;
        ParseError(ParseError&&) noexcept = default;
        ParseError& operator=(const ParseError& pe) = default;
        ParseError& operator=(ParseError&&) noexcept = default;

        using runtime_error::what;

        [[nodiscard]] const std::string& diagnostics() const noexcept { return diagnostics_; }

        ~ParseError() noexcept override = default;

        friend class ConfigFile;
    };

    class Variable {
    public:
        static constexpr uint8_t SET = 1; // set if variable appears in the
                                          // config
        static constexpr uint8_t ARRAY = 2; // set if variable is an array

    private:
        uint8_t flag_ = 0;
        std::string str_;
        std::vector<std::string> arr_;

        void unset() noexcept {
            flag_ = 0;
            str_.clear();
            arr_.clear();
        }

    public:
        [[nodiscard]] bool is_set() const noexcept { return flag_ & SET; }

        [[nodiscard]] bool is_array() const noexcept { return flag_ & ARRAY; }

        // Returns value as bool or false on error
        [[nodiscard]] bool as_bool() const noexcept {
            return (str_ == "1" || str_ == "on" || str_ == "true");
        }

        // Returns std::nullopt if the value is not a number of type T
        template <class T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
        [[nodiscard]] std::optional<T> as() const noexcept {
            T res{};
            auto [ptr, ec] = std::from_chars(str_.data(), str_.data() + str_.size(), res);
            if (ec != std::errc{} || ptr != str_.data() + str_.size()) {
                return std::nullopt;
            }
            return res;
        }

        // Returns value as string (empty if not a string or variable isn't
        // set)
        [[nodiscard]] const std::string& as_string() const noexcept { return str_; }

        // Returns value as array (empty if not an array or variable isn't set)
        [[nodiscard]] const std::vector<std::string>& as_array() const noexcept { return arr_; }

        friend class ConfigFile;
    };

private:
    std::map<std::string, Variable, std::less<>> vars; // (name => value)
    static const Variable null_var;

public:
    // Adds variables @p names to variable set, ignores duplications
    template <class... Args>
    void add_vars(Args&&... names) {
        (vars.emplace(std::forward<Args>(names), Variable{}), ...);
    }

    // Clears variable set
    void clear() { vars.clear(); }

    // Returns a reference to a variable @p name from variable set or to a
    // null_var
    [[nodiscard]] const Variable& get_var(std::string_view name) const noexcept {
        return (*this)[name];
    }

    const Variable& operator[](std::string_view name) const noexcept {
        auto it = vars.find(name);
        return (it != vars.end() ? it->second : null_var);
    }

    [[nodiscard]] const decltype(vars)& get_vars() const { return vars; }

    /**
     * @brief Loads config (variables) from file @p pathname
     * @details Uses load_config_from_string()
     *
     * @param pathname config file
     * @param load_all whether load all variables from @p pathname or load only
     *   these from variable set
     *
     * @errors Throws an exception std::runtime_error if an open(2) error
     *   occurs and all exceptions from load_config_from_string()
     */
    void load_config_from_file(const std::string& pathname, bool load_all = false);

    /**
     * @brief Loads config (variables) from string @p config
     * @details Syntax: one `name: value` or `name = value` per line, `#` starts
     *   a comment. A value is a single-quoted string ('' stands for '), a
     *   double-quoted string with C escapes, an unquoted literal (trailing
     *   white-spaces are stripped) or an array: `[` values separated by
     *   commas or newlines `]`.
     *
     * @param config input string
     * @param load_all whether load all variables from @p config or load only
     *   these from variable set
     *
     * @errors Throws an exception (ParseError) if an error occurs
     */
    void load_config_from_string(std::string config, bool load_all = false);
};
