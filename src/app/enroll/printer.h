#pragma once

#include <iomanip>
#include <ostream>
#include <string>

namespace printer {

/** @brief ANSI SGR sequences; every accessor yields "" when colouring is off. */
struct Ansi {
    bool enable = true;

    const char* sgr(const char* seq) const noexcept {
        return enable ? seq : "";
    }
    const char* reset() const noexcept {
        return sgr("\033[0m");
    }
    const char* bold() const noexcept {
        return sgr("\033[1m");
    }
    const char* dim() const noexcept {
        return sgr("\033[2m");
    }
    const char* red() const noexcept {
        return sgr("\033[31m");
    }
    const char* green() const noexcept {
        return sgr("\033[32m");
    }
    const char* yellow() const noexcept {
        return sgr("\033[33m");
    }
    const char* cyan() const noexcept {
        return sgr("\033[36m");
    }
};

/** @brief Aligned "key: value" report writer used for the config dump and the result summary. */
struct Printer {
    std::ostream& os;
    Ansi a{};
    int key_w = 22;

    void section(const std::string& title, int indent = 0) noexcept {
        os << std::string(static_cast<std::size_t>(indent > 0 ? indent : 0), ' ');
        os << a.bold() << title << ':' << a.reset() << '\n';
    }

    template <class T>
    void kv(const std::string& key, const T& value, int indent = 0, const char* value_color = nullptr) noexcept {
        const auto saved = key_(key, indent);
        os << (value_color ? value_color : "") << value << (value_color ? a.reset() : "") << '\n';
        os.flags(saved);
    }

    void kv_bool(const std::string& key, bool v, int indent = 0) noexcept {
        kv(key, v ? "true" : "false", indent, v ? a.green() : a.red());
    }

    void kv_path(const std::string& key, const std::string& path, int indent = 0) noexcept {
        if (path.empty()) {
            kv(key, "(none)", indent, a.dim());
        } else {
            kv(key, path, indent, a.cyan());
        }
    }

    void verdict(bool ok, const std::string& msg) noexcept {
        os << a.bold() << (ok ? a.green() : a.red()) << (ok ? "ACCEPTED" : "REJECTED") << a.reset() << "  " << msg
           << '\n';
    }

  private:
    std::ios_base::fmtflags key_(const std::string& key, int indent) {
        const std::ios_base::fmtflags saved = os.flags();
        os << std::string(static_cast<std::size_t>(indent > 0 ? indent : 0), ' ');
        os << std::left << std::setw(key_w) << (key + ':');
        return saved;
    }
};

} // namespace printer
