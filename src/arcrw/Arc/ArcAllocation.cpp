#include "arcrw/Arc/ArcAllocation.hpp"

namespace arcrw {
namespace detail {

void LogAllocationFailure(std::size_t size, std::size_t align) {
    error() << "arc allocation failed: size=" << size << " align=" << align;
}

void LogAllocationOverflow(std::size_t count, std::size_t elem_size) {
    error() << "arc allocation size overflow: " << count << " elements of " << elem_size << " bytes";
}

void LogBlockFreed(const ArcHeader* header) {
    debug() << "arc block " << static_cast<const void*>(header) << " freed: size="
            << header->alloc_size << " len=" << header->len;
}

} // namespace detail
} // namespace arcrw
