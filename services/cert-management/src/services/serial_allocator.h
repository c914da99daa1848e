#pragma once

#include "../repositories/certificate_repository.h"

#include <cstdint>

/**
 * @file serial_allocator.h
 * @brief Next free serial number within a CA hierarchy
 *
 * A serial is unique across a top-level CA and everything transitively
 * signed by it. The allocator climbs to the root, gathers every serial in
 * that subtree and returns max + 1.
 */

namespace services {

class SerialAllocator {
public:
    /// @throws std::invalid_argument if either repository is nullptr
    SerialAllocator(repositories::ICertificateRepository* certificates,
                    repositories::ICertificateRepository* authorities);

    /**
     * @brief Serial to assign to a certificate signed by CA @p caId
     *
     * The result is computed from the committed store; callers must persist
     * it before asking again. Unknown CA ids yield 1.
     */
    int64_t next(int64_t caId) const;

private:
    repositories::ICertificateRepository* certificates_;
    repositories::ICertificateRepository* authorities_;
};

} // namespace services
