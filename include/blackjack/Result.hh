/** \file
 *
 * \brief Definition of the result type of recoverable table operations
 */

#ifndef BLACKJACK_RESULT_HH_
#define BLACKJACK_RESULT_HH_

#include <iosfwd>
#include <string>
#include <utility>
#include <variant>

namespace Blackjack {

/** \brief Kind of a recoverable failure
 */
enum class FailureKind {
    INVALID_BET,     ///< Bet was not numeric, not positive or not covered
    ILLEGAL_ACTION,  ///< Action not in the currently permitted set
    WRONG_PHASE,     ///< Operation not available in the current table phase
};

/** \brief Struct that represents a failed operation
 *
 * \sa Result
 */
struct Failure {
    FailureKind kind;    ///< \brief The kind of the failure
    std::string reason;  ///< \brief Human readable reason for the failure
};

/** \brief Result of a recoverable operation
 *
 * The result either holds the value produced by a successful operation, or
 * a Failure describing why the operation was rejected. A rejected operation
 * never mutates the state of the object it was called on.
 *
 * \tparam T the type of the value of a successful result
 */
template<typename T>
using Result = std::variant<Failure, T>;

/** \brief Convenience function for creating failed result
 *
 * \param kind the kind of the failure
 * \param reason the reason of the failure
 *
 * \return Failure that converts to any Result
 */
inline Failure failure(const FailureKind kind, std::string reason)
{
    return Failure {kind, std::move(reason)};
}

/** \brief Determine if result is successful
 */
template<typename T>
bool isSuccessful(const Result<T>& result)
{
    return std::holds_alternative<T>(result);
}

/** \brief Get pointer to the failure of a result
 *
 * \return pointer to the failure, or nullptr if \p result is successful
 */
template<typename T>
const Failure* getFailure(const Result<T>& result)
{
    return std::get_if<Failure>(&result);
}

/** \brief Get pointer to the value of a result
 *
 * \return pointer to the value, or nullptr if \p result is a failure
 */
template<typename T>
const T* getValue(const Result<T>& result)
{
    return std::get_if<T>(&result);
}

/** \brief Output a FailureKind to stream
 *
 * \param os the output stream
 * \param kind the failure kind to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, FailureKind kind);

/** \brief Output a Failure to stream
 *
 * \param os the output stream
 * \param failure the failure to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const Failure& failure);

}

#endif // BLACKJACK_RESULT_HH_
