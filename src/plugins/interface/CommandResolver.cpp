/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: CommandResolver.cpp
 * ============================================================================
 */

#include "CommandResolver.hpp"

#include <utility>

namespace conduit {
namespace plugins {

std::string ConventionName(Convention convention) {
    switch (convention) {
        case Convention::Async: return "Async";
        case Convention::Fallible: return "Fallible";
        case Convention::Sync: return "Sync";
        case Convention::None: break;
    }
    return "None";
}

std::string CommandSignature::describe() const {
    std::string args;
    for (size_t i = 0; i < arg_encodings.size(); ++i) {
        if (i > 0) args += ", ";
        args += DecodeTypeEncoding(arg_encodings[i]);
    }
    return selector + " (" + args + ") -> " + DecodeTypeEncoding(return_encoding);
}

void CommandTable::add_sync(const std::string& name, SyncCommand fn) {
    entries_[name].sync = std::move(fn);
}

void CommandTable::add_fallible(const std::string& name, FallibleCommand fn) {
    entries_[name].fallible = std::move(fn);
}

void CommandTable::add_async(const std::string& name, AsyncCommand fn) {
    entries_[name].async = std::move(fn);
}

const CommandEntry* CommandTable::find(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

ResolvedCommand ResolveCommand(const CommandTable& table, const std::string& command) {
    ResolvedCommand resolved;
    const CommandEntry* entry = table.find(command);
    if (entry == nullptr) {
        return resolved;
    }

    if (entry->async) {
        resolved.convention = Convention::Async;
    } else if (entry->fallible) {
        resolved.convention = Convention::Fallible;
    } else if (entry->sync) {
        resolved.convention = Convention::Sync;
    } else {
        return resolved;
    }
    resolved.entry = entry;
    return resolved;
}

std::string DecodeTypeEncoding(const std::string& encoding) {
    if (encoding == "v") return "Void";
    if (encoding == "@") return "Object";
    if (encoding == ":") return "Selector";
    if (encoding == "i") return "Int32";
    if (encoding == "q") return "Int64";
    if (encoding == "d") return "Double";
    if (encoding == "f") return "Float";
    if (encoding == "B") return "Bool";
    if (encoding == "@?") return "Block";
    return encoding; // raw code, e.g. "^@" for the error slot
}

std::vector<CommandSignature> ListSignatures(const CommandTable& table) {
    std::vector<CommandSignature> signatures;
    for (const auto& pair : table.entries()) {
        const std::string& name = pair.first;
        const CommandEntry& entry = pair.second;

        if (entry.async) {
            signatures.push_back({name + ":completionHandler:", {"@", "@?"}, "v"});
        }
        if (entry.fallible) {
            signatures.push_back({name + ":error:", {"@", "^@"}, "v"});
        }
        if (entry.sync) {
            signatures.push_back({name + ":", {"@"}, "v"});
        }
    }
    return signatures;
}

std::string BuildCommandDirectory(const CommandTable& table) {
    std::string directory;
    for (const auto& signature : ListSignatures(table)) {
        if (!directory.empty()) directory += "\n";
        directory += signature.describe();
    }
    return directory;
}

} // namespace plugins
} // namespace conduit
