//
// Created by Giuseppe Francione on 03/02/26.
//

#include "../../include/engine_lock.hpp"

namespace folio {

std::mutex& engine_mutex() {
    static std::mutex mtx;
    return mtx;
}

} // namespace folio
