/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: CommandResolver.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Every plugin declares its commands up front in a CommandTable. A command
 * name can carry up to three handlers, one per calling convention:
 *
 *   Async     cmd:completionHandler:   (Invoke, Completion)   -> Void
 *   Fallible  cmd:error:               (Invoke, error slot)   -> Void
 *   Sync      cmd:                     (Invoke)               -> Void
 *
 * ResolveCommand() checks them in exactly that order and the first match
 * wins. When nothing matches, the plugin's command directory (built once at
 * registration) is what gets reported back to the caller.
 * ============================================================================
 */

#ifndef CONDUIT_COMMAND_RESOLVER_HPP
#define CONDUIT_COMMAND_RESOLVER_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>
#include "Invoke.hpp"

namespace conduit {
namespace plugins {

    // Must call invoke.send_response (or resolve/reject) before returning.
    using SyncCommand = std::function<void(Invoke& invoke)>;

    // A non-empty error after return becomes the error response.
    using FallibleCommand = std::function<void(Invoke& invoke, std::string& error)>;

    // Must eventually call done(), with an error message on failure.
    using AsyncCommand = std::function<void(Invoke& invoke, Completion done)>;

    enum class Convention {
        None,
        Async,
        Fallible,
        Sync
    };

    std::string ConventionName(Convention convention);

    struct CommandEntry {
        AsyncCommand async;
        FallibleCommand fallible;
        SyncCommand sync;
    };

    /**
     * @brief Declared shape of one handler, in type-encoding form.
     */
    struct CommandSignature {
        std::string selector;                  // e.g. "ping:error:"
        std::vector<std::string> arg_encodings; // e.g. {"@", "^@"}
        std::string return_encoding = "v";

        // "ping:error: (Object, ^@) -> Void"
        std::string describe() const;
    };

    class CommandTable {
    public:
        void add_sync(const std::string& name, SyncCommand fn);
        void add_fallible(const std::string& name, FallibleCommand fn);
        void add_async(const std::string& name, AsyncCommand fn);

        // nullptr when the name is unknown.
        const CommandEntry* find(const std::string& name) const;

        bool empty() const { return entries_.empty(); }
        const std::map<std::string, CommandEntry>& entries() const { return entries_; }

    private:
        std::map<std::string, CommandEntry> entries_;
    };

    struct ResolvedCommand {
        Convention convention = Convention::None;
        const CommandEntry* entry = nullptr;

        explicit operator bool() const { return convention != Convention::None; }
    };

    /**
     * @brief Picks the calling convention for a command: Async, then
     * Fallible, then Sync. Names are compared verbatim (case-sensitive).
     */
    ResolvedCommand ResolveCommand(const CommandTable& table, const std::string& command);

    /**
     * @brief Maps a type-encoding code to its readable name
     * ("v" -> "Void", "@?" -> "Block", ...). Unknown codes come back as-is.
     */
    std::string DecodeTypeEncoding(const std::string& encoding);

    // Signatures of every handler in the table, ordered by command name.
    std::vector<CommandSignature> ListSignatures(const CommandTable& table);

    // One describe() line per handler, joined with '\n'.
    std::string BuildCommandDirectory(const CommandTable& table);

} // namespace plugins
} // namespace conduit

#endif // CONDUIT_COMMAND_RESOLVER_HPP
