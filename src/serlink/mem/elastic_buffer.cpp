/**
 * @file elastic_buffer.cpp
 * @brief Explicit template instantiations for ElasticBuffer to reduce code bloat.
*/

#include "serlink/mem/elastic_buffer.hpp"
#include "serlink/stream/flit.hpp"

namespace serlink::mem {

    /// One compiled instance instead of every TU instantiating its own.

    template class ElasticBuffer<stream::WordFlit>;   // tx/rx and lane buffers
} // namespace serlink::mem
