#include "announcement.h"
#include "relay.h"

#include <sys/ioctl.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>

namespace bashdrop {

namespace {

/* ANSI colors */
constexpr const char* RESET = "\033[0m";
constexpr const char* DIM = "\033[2m";
constexpr const char* RED = "\033[31m";
constexpr const char* BRIGHT_RED = "\033[91m";
constexpr const char* BRIGHT_GREEN = "\033[92m";
constexpr const char* BRIGHT_YELLOW = "\033[93m";
constexpr const char* BRIGHT_BLUE = "\033[94m";
constexpr const char* BRIGHT_MAG = "\033[95m";
constexpr const char* BRIGHT_CYAN = "\033[96m";
constexpr const char* BRIGHT_WHITE = "\033[97m";

constexpr int kDefaultWidth = 100;
constexpr int kMinWidth = 60;

int terminal_width() {
    winsize ws{};
    if (isatty(STDOUT_FILENO) && ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return std::max(kMinWidth, static_cast<int>(ws.ws_col));
    }
    return kDefaultWidth;
}

class Painter {
public:
    explicit Painter(bool enabled) : enabled_(enabled) {}

    std::string operator()(const std::string& text, const char* color) const {
        if (!enabled_) {
            return text;
        }
        return std::string(color) + text + RESET;
    }

private:
    bool enabled_;
};

std::string repeat(const char* glyph, int count) {
    std::string out;
    for (int i = 0; i < count; ++i) {
        out += glyph;
    }
    return out;
}

void box_title(std::ostream& out, const Painter& paint, const std::string& text, const char* color) {
    int width = terminal_width();
    std::string label = " " + text + " ";
    int side = std::max(0, (width - static_cast<int>(label.size()) - 2) / 2);
    int right = side;
    if (2 * side + static_cast<int>(label.size()) < width - 2) {
        ++right;
    }
    out << paint("┌" + repeat("─", side) + label + repeat("─", right) + "┐", color) << '\n';
}

void box_footer(std::ostream& out, const Painter& paint, const char* color) {
    out << paint("└" + repeat("─", terminal_width() - 2) + "┘", color) << '\n';
}

void cmd_block(std::ostream& out, const Painter& paint, const std::string& cmd) {
    std::string rule = repeat("─", terminal_width());
    out << paint(rule, DIM) << '\n' << cmd << '\n' << paint(rule, DIM) << '\n';
}

void info_kv(std::ostream& out, const Painter& paint, const std::string& key, const std::string& value) {
    out << paint(key + ":", DIM) << ' ' << paint(value, BRIGHT_WHITE) << '\n';
}

const char* mode_color(TransferMode mode) {
    switch (mode) {
        case TransferMode::PLAIN: return RED;
        case TransferMode::INTEGRITY: return BRIGHT_YELLOW;
        case TransferMode::ENCRYPTED_INTEGRITY: return BRIGHT_CYAN;
    }
    return BRIGHT_WHITE;
}

std::string tcp_path(const Announcement& a) {
    return shell_quote("/dev/tcp/" + a.host + "/" + std::to_string(a.port));
}

/* The 64-hex-char digest of a file, as the INTEGRITY trailer carries it */
std::string digest_of(const std::string& quoted_file) {
    return "sha256sum <" + quoted_file + " | head -c 64";
}

std::string openssl_cmd(const Announcement& a, const ModeDescriptor& d, bool decrypt) {
    std::string cmd = "openssl enc ";
    if (decrypt) {
        cmd += "-d ";
    }
    cmd += d.cipher;
    if (!decrypt) {
        cmd += " -salt";
    }
    cmd += " -pass " + shell_quote("pass:" + a.password);
    return cmd;
}

/*
 * Splits F.part into F and its 64-char trailer and compares the trailer
 * with the digest of F.
 */
std::string verify_tail(const Announcement& a) {
    std::string file = shell_quote(a.filename);
    std::string part = shell_quote(a.filename + ".part");
    return "head -c -64 " + part + " >" + file +
           " && if [ \"$(tail -c 64 " + part + ")\" = \"$(" + digest_of(file) + ")\" ];" +
           " then rm -f " + part + "; echo 'sha256 OK';" +
           " else echo 'sha256 MISMATCH: transfer truncated or corrupted' >&2; fi";
}

}  // namespace

Announcement announce(const SessionDescriptor& session) {
    Announcement a;
    a.host = session.host();
    a.port = session.port();
    a.filename = session.filename();
    a.password = session.password();
    for (TransferMode mode : session.modes()) {
        a.modes.push_back(mode_descriptor(mode));
    }
    return a;
}

std::string shell_quote(const std::string& word) {
    if (word.empty()) {
        return "''";
    }
    bool safe = std::all_of(word.begin(), word.end(), [](unsigned char ch) {
        return std::isalnum(ch) || std::string("_./-+:=@,%").find(static_cast<char>(ch)) != std::string::npos;
    });
    if (safe) {
        return word;
    }
    std::string quoted = "'";
    for (char ch : word) {
        if (ch == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(ch);
        }
    }
    quoted += "'";
    return quoted;
}

std::string sender_command(const Announcement& a, TransferMode mode) {
    const ModeDescriptor& d = mode_descriptor(mode);
    std::string file = shell_quote(a.filename);
    std::string target = tcp_path(a);

    switch (mode) {
        case TransferMode::PLAIN:
            return "cat <" + file + " >" + target;
        case TransferMode::INTEGRITY:
            return "{ cat " + file + "; " + digest_of(file) + "; } >" + target;
        case TransferMode::ENCRYPTED_INTEGRITY:
            return "{ cat " + file + "; " + digest_of(file) + "; } | " +
                   openssl_cmd(a, d, false) + " >" + target;
    }
    return std::string();
}

std::string receiver_command(const Announcement& a, TransferMode mode) {
    const ModeDescriptor& d = mode_descriptor(mode);
    std::string file = shell_quote(a.filename);
    std::string part = shell_quote(a.filename + ".part");
    std::string source = tcp_path(a);

    switch (mode) {
        case TransferMode::PLAIN:
            return "cat <" + source + " >" + file;
        case TransferMode::INTEGRITY:
            return "cat <" + source + " >" + part + " && " + verify_tail(a);
        case TransferMode::ENCRYPTED_INTEGRITY:
            return openssl_cmd(a, d, true) + " <" + source + " >" + part + " && " + verify_tail(a);
    }
    return std::string();
}

void render_announcement(std::ostream& out, const Announcement& a, bool color) {
    Painter paint(color);

    out << '\n';
    box_title(out, paint, "One-shot relay: sender -> relay -> receiver, once", BRIGHT_GREEN);
    out << paint("Relays a single upload straight to a single download, stores nothing, then exits.", DIM)
        << "\n\n";
    info_kv(out, paint, "Public host/IP", a.host);
    info_kv(out, paint, "Port", std::to_string(a.port));
    info_kv(out, paint, "Filename", a.filename);
    info_kv(out, paint, "Password (encrypted mode)", a.password);
    box_footer(out, paint, BRIGHT_GREEN);
    out << '\n';

    box_title(out, paint, "Sender (SOURCE)", BRIGHT_BLUE);
    out << paint("Choose ONE mode and run exactly as shown (bash required for /dev/tcp).", DIM) << "\n\n";
    for (const auto& d : a.modes) {
        out << paint(std::string("[") + d.label + "]", mode_color(d.mode)) << '\n';
        cmd_block(out, paint, sender_command(a, d.mode));
    }
    box_footer(out, paint, BRIGHT_BLUE);
    out << '\n';

    box_title(out, paint, "Receiver (DESTINATION), connect after the sender", BRIGHT_MAG);
    out << paint("Use the same mode as the sender. The first connection is always treated as the sender.", DIM)
        << "\n\n";
    for (const auto& d : a.modes) {
        out << paint(std::string("[") + d.label + "]", mode_color(d.mode)) << '\n';
        cmd_block(out, paint, receiver_command(a, d.mode));
    }
    box_footer(out, paint, BRIGHT_MAG);
    out << '\n';
}

void render_listening(std::ostream& out, const Announcement& a, int pairing_timeout_seconds, bool color) {
    Painter paint(color);
    box_title(out, paint, "Waiting for sender", BRIGHT_WHITE);
    out << paint("Listening on port " + std::to_string(a.port) +
                 ". First connection = sender, second = receiver (within " +
                 std::to_string(pairing_timeout_seconds) + "s), any further connection is refused.", DIM)
        << '\n';
    box_footer(out, paint, BRIGHT_WHITE);
    out.flush();
}

void render_outcome(std::ostream& out, const RelayOutcome& outcome, bool color) {
    Painter paint(color);
    if (outcome.succeeded()) {
        out << paint("Done.", BRIGHT_GREEN) << ' ' << outcome.reason << '\n';
    } else {
        out << paint(std::string("Failed (") + error_name(outcome.error) + ", while " +
                     state_name(outcome.failed_in) + "):", BRIGHT_RED) << ' '
            << outcome.reason << '\n';
    }
    if (outcome.rejected_connections > 0) {
        out << paint("Refused " + std::to_string(outcome.rejected_connections) +
                     " extra connection(s) while paired.", DIM) << '\n';
    }
    out.flush();
}

}  // namespace bashdrop
