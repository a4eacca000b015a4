/**
 * @file CommandModule.cpp
 * @brief Implementation file.
 */
#include "CommandModule.h"
#include "Core/ErrorCodes.h"
#define LOG_TAG "CmdModul"
#include "Core/ModuleLog.h"


bool CommandModule::svcRegister(void* ctx, const char* cmd, CommandHandler fn, void* userCtx) {
    return ((CommandRegistry*)ctx)->registerHandler(cmd, fn, userCtx);
}

bool CommandModule::svcExecute(void* ctx, const char* cmd, const char* json, const char* args,
                               char* reply, size_t replyLen) {
    return ((CommandRegistry*)ctx)->execute(cmd, json, args, reply, replyLen);
}

bool CommandModule::cmdList(void* userCtx, const CommandRequest&, char* reply, size_t replyLen) {
    CommandModule* self = static_cast<CommandModule*>(userCtx);
    if (!self) return false;
    if (self->registry.writeCommandList(reply, replyLen)) return true;
    if (!writeErrorJson(reply, replyLen, ErrorCode::Failed, "cmd.list")) {
        snprintf(reply, replyLen, "{\"ok\":false}");
    }
    return false;
}

void CommandModule::init(ConfigStore&, ServiceRegistry& services) {
    static CommandService svc{ svcRegister, svcExecute, nullptr };
    svc.ctx = &registry;
    services.add("cmd", &svc);

    logHub = services.get<LogHubService>("loghub");
    registry.registerHandler("cmd.list", cmdList, this);
    LOGI("CommandService registered");
}
