//
// Created by Giuseppe Francione on 03/02/26.
//

#ifndef FOLIO_ENGINE_LOCK_HPP
#define FOLIO_ENGINE_LOCK_HPP

#include <mutex>

namespace folio {

/**
 * @brief Process-wide mutex serializing every call into the PDF engines.
 *
 * At most one engine operation runs at a time, whatever the number of
 * Folio instances or calling threads. Operations take it once at their
 * boundary; nothing below that boundary locks again.
 */
std::mutex& engine_mutex();

} // namespace folio

#endif // FOLIO_ENGINE_LOCK_HPP
