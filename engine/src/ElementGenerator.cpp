#include "engine/ElementGenerator.h"
#include "generators/GeneratorCommon.h"

#include <algorithm>
#include <functional>
#include <optional>
#include <thread>
#include <type_traits>

namespace StbGeom::Engine {

    namespace {

        constexpr const char* kComponent = "Orchestrator";

        bool isCancelled(const std::atomic<bool>* cancel) {
            return cancel && cancel->load(std::memory_order_relaxed);
        }

        // Runs [begin, end) into its own slots of outcomes; a slot left empty
        // means the element was never started.
        void runRange(const std::vector<ElementRecord>& elements, size_t begin, size_t end,
            const GenerationContext& context, const std::atomic<bool>* cancel,
            std::vector<std::optional<ElementOutcome>>& outcomes)
        {
            for (size_t i = begin; i < end; ++i) {
                if (isCancelled(cancel)) return;
                outcomes[i] = generateElement(elements[i], context);
            }
        }

    } // namespace

    ElementOutcome generateElement(const ElementRecord& element, const GenerationContext& context) {
        return std::visit([&context](const auto& record) -> ElementOutcome {
            using T = std::decay_t<decltype(record)>;
            if constexpr (std::is_same_v<T, ColumnElement>) {
                return Generators::generateColumn(record, context);
            } else if constexpr (std::is_same_v<T, BeamElement>) {
                return Generators::generateBeam(record, context);
            } else if constexpr (std::is_same_v<T, BraceElement>) {
                return Generators::generateBrace(record, context);
            } else if constexpr (std::is_same_v<T, PileElement>) {
                return Generators::generatePile(record, context);
            } else if constexpr (std::is_same_v<T, FootingElement>) {
                return Generators::generateFooting(record, context);
            } else if constexpr (std::is_same_v<T, SlabElement>) {
                return Generators::generateSlab(record, context);
            } else {
                return Generators::generateWall(record, context);
            }
        }, element);
    }

    BatchResult generateBatch(const std::vector<ElementRecord>& elements, const GenerationContext& context,
        const std::atomic<bool>* cancel)
    {
        std::vector<std::optional<ElementOutcome>> outcomes(elements.size());

        const size_t workers = std::min(std::max<size_t>(context.options.workerCount, 1), elements.size());
        if (workers <= 1) {
            runRange(elements, 0, elements.size(), context, cancel, outcomes);
        } else {
            // Contiguous chunks, every worker writes only its own slots.
            std::vector<std::thread> threads;
            threads.reserve(workers);
            const size_t chunk = (elements.size() + workers - 1) / workers;
            for (size_t begin = 0; begin < elements.size(); begin += chunk) {
                const size_t end = std::min(begin + chunk, elements.size());
                threads.emplace_back(runRange, std::cref(elements), begin, end, std::cref(context), cancel,
                    std::ref(outcomes));
            }
            for (auto& thread : threads) {
                thread.join();
            }
        }

        BatchResult result;
        for (auto& outcome : outcomes) {
            if (!outcome) {
                result.cancelled = true;
                continue;
            }
            ++result.processed;
            if (outcome->skipped) {
                const SkippedElement& skip = *outcome->skipped;
                context.logger.warn(kComponent, "{} '{}' skipped ({}): {}", elementFamilyName(skip.family),
                    skip.elementId, skipReasonName(skip.reason), skip.detail);
                result.skipped.push_back(std::move(*outcome->skipped));
            }
            for (auto& solid : outcome->solids) {
                result.solids.push_back(std::move(solid));
            }
        }
        if (isCancelled(cancel)) {
            result.cancelled = true;
        }
        context.logger.info(kComponent, "{} of {} elements processed, {} solids, {} skipped{}",
            result.processed, elements.size(), result.solids.size(), result.skipped.size(),
            result.cancelled ? ", cancelled" : "");
        return result;
    }

} // namespace StbGeom::Engine
