/**
 * @file CommandRegistry.cpp
 * @brief Command table and dispatch.
 */
#include "CommandRegistry.h"
#include "Core/ErrorCodes.h"
#include "Core/SnprintfCheck.h"
#include <cstring>
#include <cstdio>
#define LOG_TAG_CORE "CmdRegst"
#undef snprintf
#define snprintf(OUT, LEN, FMT, ...) \
    IRRIGO_SNPRINTF_CHECKED(LOG_TAG_CORE, OUT, LEN, FMT, ##__VA_ARGS__)

static bool isJsonObjectReply_(const char* s, size_t len)
{
    if (!s || len == 0) return false;
    for (size_t i = 0; i < len; ++i) {
        const char c = s[i];
        if (c == '\0') return false;
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            return c == '{';
        }
    }
    return false;
}

static void writeFallbackError_(char* reply, size_t replyLen, ErrorCode code, const char* where)
{
    if (!reply || replyLen == 0) return;
    if (!writeErrorJson(reply, replyLen, code, where)) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
}

bool CommandRegistry::registerHandler(const char* cmd, CommandHandler fn, void* userCtx) {
    if (!cmd || !fn) return false;
    if (count >= MAX_COMMANDS) {
        Log::error(LOG_TAG_CORE, "command table full, cmd=%s", cmd);
        return false;
    }

    for (uint8_t i = 0; i < count; ++i) {
        if (strcmp(entries[i].cmd, cmd) == 0) return false;
    }

    entries[count++] = {cmd, fn, userCtx};
    return true;
}

bool CommandRegistry::execute(const char* cmd, const char* json, const char* args, char* reply, size_t replyLen) {
    if (!cmd) {
        writeFallbackError_(reply, replyLen, ErrorCode::MissingCmd, "command");
        return false;
    }
    for (uint8_t i = 0; i < count; ++i) {
        if (strcmp(entries[i].cmd, cmd) != 0) continue;

        CommandRequest req{cmd, json, args};
        const bool ok = entries[i].fn(entries[i].userCtx, req, reply, replyLen);
        if (reply && replyLen && !isJsonObjectReply_(reply, replyLen)) {
            Log::warn(LOG_TAG_CORE, "handler %s wrote a non-object reply", cmd);
            writeFallbackError_(reply, replyLen, ErrorCode::CmdHandlerFailed, "command.reply");
            return false;
        }
        return ok;
    }
    writeFallbackError_(reply, replyLen, ErrorCode::UnknownCmd, "command");
    return false;
}

bool CommandRegistry::writeCommandList(char* out, size_t outLen) const {
    if (!out || outLen == 0) return false;
    int wrote = snprintf(out, outLen, "{\"ok\":true,\"cmds\":[");
    if (wrote < 0 || (size_t)wrote >= outLen) return false;
    size_t pos = (size_t)wrote;

    for (uint8_t i = 0; i < count; ++i) {
        wrote = snprintf(out + pos, outLen - pos, "%s\"%s\"", (i == 0) ? "" : ",", entries[i].cmd);
        if (wrote < 0 || (size_t)wrote >= (outLen - pos)) return false;
        pos += (size_t)wrote;
    }

    wrote = snprintf(out + pos, outLen - pos, "]}");
    return wrote >= 0 && (size_t)wrote < (outLen - pos);
}
