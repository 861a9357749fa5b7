#include "conversation.h"

#include <openssl/crypto.h>

#include <cctype>
#include <utility>

#include <termios.h>
#include <unistd.h>

namespace {

// Turns terminal echo off for its lifetime; no-op when stdin is not a tty.
class EchoOff {
public:
    EchoOff() {
        if (!::isatty(STDIN_FILENO)) return;
        if (::tcgetattr(STDIN_FILENO, &saved_) != 0) return;
        termios tty = saved_;
        tty.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        active_ = ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &tty) == 0;
    }
    ~EchoOff() {
        if (active_) ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_);
    }
    EchoOff(const EchoOff&) = delete;
    EchoOff& operator=(const EchoOff&) = delete;

    bool active() const noexcept { return active_; }

private:
    termios saved_{};
    bool active_ = false;
};

} // namespace

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool is_affirmative(const std::string& answer) {
    std::string word = trim(answer);
    for (char& c : word) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return word == "yes";
}

// ---- TerminalConversation ---------------------------------------------------

TerminalConversation::TerminalConversation(std::istream& in, std::ostream& out, std::ostream& err)
    : in_(in), out_(out), err_(err) {}

std::optional<std::string> TerminalConversation::read_line() {
    std::string line;
    if (!std::getline(in_, line)) return std::nullopt;
    std::string out = trim(line);
    if (!line.empty()) OPENSSL_cleanse(&line[0], line.size());
    return out;
}

std::optional<std::string> TerminalConversation::prompt_masked(const std::string& prompt) {
    out_ << prompt << std::flush;
    EchoOff guard;
    auto line = read_line();
    if (guard.active()) out_ << '\n';
    return line;
}

std::optional<std::string> TerminalConversation::prompt_echo(const std::string& prompt) {
    out_ << prompt << std::flush;
    return read_line();
}

void TerminalConversation::info(const std::string& msg)  { out_ << msg << '\n' << std::flush; }
void TerminalConversation::error(const std::string& msg) { err_ << msg << '\n' << std::flush; }

// ---- ScriptedConversation ---------------------------------------------------

ScriptedConversation::ScriptedConversation(std::vector<std::string> answers)
    : answers_(answers.begin(), answers.end()) {}

std::optional<std::string> ScriptedConversation::prompt_masked(const std::string& prompt) {
    prompts_.push_back(prompt);
    if (answers_.empty()) return std::nullopt;
    std::string a = std::move(answers_.front());
    answers_.pop_front();
    return trim(a);
}

std::optional<std::string> ScriptedConversation::prompt_echo(const std::string& prompt) {
    return prompt_masked(prompt);
}

void ScriptedConversation::info(const std::string& msg)  { infos_.push_back(msg); }
void ScriptedConversation::error(const std::string& msg) { errors_.push_back(msg); }
