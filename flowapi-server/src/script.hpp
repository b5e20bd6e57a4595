/**
 * @file script.hpp
 * @brief Sandboxed expression language for DataTransformer nodes
 *
 * A script is a sequence of statements evaluated against three roots:
 * `data` and `state` (writable) and `config` (read-only). Nothing else is
 * reachable from a script, and the language has no loops, so every script
 * terminates.
 *
 * Example:
 *   @code
 *   # count passes through the transformer chain
 *   state.A = coalesce(state.A, 0) + 1
 *   if has(data.param, "name") {
 *       data.body = {"greeting": "hello " + data.param.name}
 *   } else {
 *       data.body = {"greeting": "hello"}; data.status = 200
 *   }
 *   del data.headers
 *   @endcode
 */

#ifndef FLOWAPI_SCRIPT_HPP
#define FLOWAPI_SCRIPT_HPP

#include "node_type.hpp"
#include <string>
#include <memory>
#include <vector>

namespace flowapi {
namespace script {

struct Program;

/**
 * @brief A parsed, immutable script
 *
 * Copies share the parsed program. run() is safe to call concurrently with
 * different roots.
 */
class Script {
public:
    /**
     * @brief Parse a script
     *
     * @throws ScriptSyntaxError On malformed input, unknown functions, wrong
     *         argument counts or assignments to `config`
     */
    static Script compile(const std::string& source);

    /**
     * @brief Evaluate the script, mutating data and state in place
     *
     * @throws ScriptError On runtime type errors, division by zero, invalid
     *         assignments or failed conversions
     */
    void run(Value& data, Value& state, const Value& config) const;

    /**
     * @brief Number of top-level statements
     */
    size_t size() const;

private:
    explicit Script(std::shared_ptr<const Program> program);

    std::shared_ptr<const Program> program_;
};

/**
 * @brief Truthiness used by `if`, `!`, `&&`, `||` and `?:`
 *
 * null, false, 0, "" and empty containers are false; everything else is true.
 */
bool is_truthy(const Value& value);

/**
 * @brief Names of the functions callable from scripts
 */
std::vector<std::string> builtin_function_names();

} // namespace script
} // namespace flowapi

#endif // FLOWAPI_SCRIPT_HPP
