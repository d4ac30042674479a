/**
 * @file Convert.cpp
 * @brief Batch conversion between core color spaces
 */

#include <Chroma/Color/Convert.h>
#include <Chroma/Core/Validate.h>

#include <cstdint>
#include <cstdio>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace Chroma::Color {

template<typename Out, typename In>
void ConvertBatch(const std::vector<In>& input, std::vector<Out>& output) {
    Validate::RequireSameSize(input.size(), output.size(), "ConvertBatch");

    const int64_t count = static_cast<int64_t>(input.size());

#ifdef CHROMA_DEBUG
#ifdef _OPENMP
    const int workers = omp_get_max_threads();
#else
    const int workers = 1;
#endif
    std::fprintf(stderr, "[ConvertBatch] %s -> %s: %lld colors, %d workers\n",
                 ColorSpaceName<In>(), ColorSpaceName<Out>(),
                 static_cast<long long>(count), workers);
#endif

    #pragma omp parallel for schedule(static)
    for (int64_t i = 0; i < count; ++i) {
        const size_t idx = static_cast<size_t>(i);
        output[idx] = Convert<Out>(input[idx]);
    }
}

#define CHROMA_INSTANTIATE_CONVERT_BATCH(In, Out) \
    template void ConvertBatch<Out, In>(const std::vector<In>&, std::vector<Out>&)

CHROMA_INSTANTIATE_CONVERT_BATCH(Xyz, Xyz);
CHROMA_INSTANTIATE_CONVERT_BATCH(Xyz, LinearRgb);
CHROMA_INSTANTIATE_CONVERT_BATCH(Xyz, Oklab);
CHROMA_INSTANTIATE_CONVERT_BATCH(LinearRgb, Xyz);
CHROMA_INSTANTIATE_CONVERT_BATCH(LinearRgb, LinearRgb);
CHROMA_INSTANTIATE_CONVERT_BATCH(LinearRgb, Oklab);
CHROMA_INSTANTIATE_CONVERT_BATCH(Oklab, Xyz);
CHROMA_INSTANTIATE_CONVERT_BATCH(Oklab, LinearRgb);
CHROMA_INSTANTIATE_CONVERT_BATCH(Oklab, Oklab);

#undef CHROMA_INSTANTIATE_CONVERT_BATCH

} // namespace Chroma::Color
