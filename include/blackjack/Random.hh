/** \file
 *
 * \brief The random number generator used to shuffle shoes
 */

#ifndef BLACKJACK_RANDOM_HH_
#define BLACKJACK_RANDOM_HH_

#include <optional>
#include <random>

namespace Blackjack {

/** \brief The random number generator of the Blackjack engine
 *
 * All randomized operations accept a reference to an engine of this type, so
 * that a seeded engine can be injected to make shoes reproducible.
 */
using Rng = std::mt19937;

/** \brief Get reference to the process wide random number generator
 *
 * \return Reference to a generator seeded from the OS random number source
 */
Rng& getRng();

/** \brief Create a random number generator
 *
 * \param seed the seed, or nullopt to seed from the OS random number source
 *
 * \return the new generator
 */
Rng makeRng(std::optional<Rng::result_type> seed);

}

#endif // BLACKJACK_RANDOM_HH_
