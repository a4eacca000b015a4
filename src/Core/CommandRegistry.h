#pragma once
/**
 * @file CommandRegistry.h
 * @brief Command registration and execution.
 */
#include <stdint.h>
#include <stddef.h>

/** @brief Maximum number of registered commands. */
constexpr uint8_t MAX_COMMANDS = 24;

/** @brief Command invocation context. `args` is the raw JSON of the "args" member. */
struct CommandRequest {
    const char* cmd;
    const char* json;
    const char* args;
};

/** @brief Handler signature. Handlers must write a JSON object into `reply`. */
using CommandHandler = bool (*)(void* userCtx,
                                const CommandRequest& req,
                                char* reply,
                                size_t replyLen);

struct CommandEntry {
    const char* cmd;
    CommandHandler fn;
    void* userCtx;
};

/**
 * @brief Registry of command handlers.
 */
class CommandRegistry {
public:
    /** @brief Register a handler for a command string (names are unique). */
    bool registerHandler(const char* cmd, CommandHandler fn, void* userCtx);
    /** @brief Execute a command into a reply buffer. */
    bool execute(const char* cmd, const char* json, const char* args, char* reply, size_t replyLen);
    /** @brief Write `{"ok":true,"cmds":[...]}` with every registered name. */
    bool writeCommandList(char* out, size_t outLen) const;

    uint8_t size() const { return count; }

private:
    CommandEntry entries[MAX_COMMANDS]{};
    uint8_t count = 0;
};
