// include/conversation.h
#pragma once
#include <deque>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// Host-side prompt channel. The verifier never talks to it; the
// Authenticator and the setup tool pass what it returns into verify().
class Conversation {
public:
    virtual ~Conversation() = default;

    // Masked line from the user, or nullopt when there is no response.
    virtual std::optional<std::string> prompt_masked(const std::string& prompt) = 0;
    // Visible line from the user, or nullopt on end of input.
    virtual std::optional<std::string> prompt_echo(const std::string& prompt) = 0;
    virtual void info(const std::string& msg) = 0;
    virtual void error(const std::string& msg) = 0;
};

// stdin/stdout conversation. Echo is switched off with termios while a
// masked prompt is pending if stdin is a terminal.
class TerminalConversation : public Conversation {
public:
    explicit TerminalConversation(std::istream& in = std::cin,
                                  std::ostream& out = std::cout,
                                  std::ostream& err = std::cerr);

    std::optional<std::string> prompt_masked(const std::string& prompt) override;
    std::optional<std::string> prompt_echo(const std::string& prompt) override;
    void info(const std::string& msg) override;
    void error(const std::string& msg) override;

private:
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;

    std::optional<std::string> read_line();
};

// Replays canned answers; records every prompt and message. Used by tests.
class ScriptedConversation : public Conversation {
public:
    explicit ScriptedConversation(std::vector<std::string> answers);

    std::optional<std::string> prompt_masked(const std::string& prompt) override;
    std::optional<std::string> prompt_echo(const std::string& prompt) override;
    void info(const std::string& msg) override;
    void error(const std::string& msg) override;

    const std::vector<std::string>& prompts() const noexcept { return prompts_; }
    const std::vector<std::string>& infos() const noexcept { return infos_; }
    const std::vector<std::string>& errors() const noexcept { return errors_; }

private:
    std::deque<std::string> answers_;
    std::vector<std::string> prompts_;
    std::vector<std::string> infos_;
    std::vector<std::string> errors_;
};

// Strips leading/trailing ASCII whitespace (CR/LF from terminals included).
std::string trim(const std::string& s);

// True for "yes" in any letter case, surrounding whitespace ignored.
bool is_affirmative(const std::string& answer);
