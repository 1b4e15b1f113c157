#include "TemplateStore.hpp"
#include "../processing/ImageDecoder.hpp"
#include <shared/utils/Logger.hpp>
#include <algorithm>
#include <chrono>
#include <optional>
#include <sstream>
#include <thread>

namespace HotbarScan::Internal::Templates {

TemplateStore::StoreSettings::StoreSettings() : maxConcurrentLoads(0) {}

std::string TemplateStore::LoadReport::getSummary() const {
    std::ostringstream oss;
    if (alreadyLoaded) {
        oss << "Templates already loaded";
        return oss.str();
    }
    oss << "Templates: " << loaded << "/" << attempted << " loaded";
    if (failed > 0) oss << ", " << failed << " failed";
    if (skipped > 0) oss << ", " << skipped << " without icon";
    oss << " (" << loadTimeMs << "ms)";
    return oss.str();
}

TemplateStore::TemplateStore(const StoreSettings& settings, IconLoader loader)
    : settings_(settings), loader_(std::move(loader)), loaded_(false) {
    if (!loader_) loader_ = defaultIconLoader();
}

std::vector<std::string> TemplateStore::iconPathCandidates(const std::string& iconPath) {
    auto replaceExtension = [&iconPath](const std::string& from, const std::string& to) {
        return iconPath.substr(0, iconPath.size() - from.size()) + to;
    };
    auto endsWith = [&iconPath](const std::string& suffix) {
        return iconPath.size() >= suffix.size() &&
               iconPath.compare(iconPath.size() - suffix.size(), suffix.size(), suffix) == 0;
    };

    if (endsWith(".png")) return {replaceExtension(".png", ".webp"), iconPath};
    if (endsWith(".webp")) return {iconPath, replaceExtension(".webp", ".png")};
    return {iconPath};
}

TemplateStore::IconLoader TemplateStore::defaultIconLoader() {
    return [](const Domain::ItemDescriptor& item) {
        for (const auto& path : iconPathCandidates(item.iconPath)) {
            Types::Image icon = Processing::ImageDecoder::tryReadFile(path);
            if (!icon.empty()) return icon;
        }
        return Types::Image();
    };
}

Domain::TemplateEntry TemplateStore::buildEntry(const Domain::ItemDescriptor& item) const {
    Types::Image icon = loader_(item);
    if (icon.empty()) {
        throw Types::ImageDecodeError("No decodable icon at " + item.iconPath);
    }
    if (icon.type() != CV_8UC4) {
        icon = Processing::ImageDecoder::toRgba(icon);
    }

    Domain::TemplateEntry entry;
    entry.itemId = item.id;
    entry.image = icon;
    entry.width = icon.cols;
    entry.height = icon.rows;
    entry.colorProfile = analyzer_.extractProfile(icon);
    entry.avgHsv = analyzer_.averageHsv(icon);
    entry.rarity = item.rarity;
    return entry;
}

void TemplateStore::insert(const Domain::ItemDescriptor& item, Domain::TemplateEntry entry) {
    auto removeIndex = [](std::vector<size_t>& list, size_t index) {
        list.erase(std::remove(list.begin(), list.end(), index), list.end());
    };

    size_t index;
    auto existing = indexById_.find(item.id);
    if (existing != indexById_.end()) {
        // Last load wins; drop the previous index entries first.
        index = existing->second;
        removeIndex(byRarity_[items_[index].rarity], index);
        removeIndex(byColor_[entries_[item.id].colorProfile.dominant], index);
        items_[index] = item;
    } else {
        index = items_.size();
        items_.push_back(item);
        indexById_[item.id] = index;
    }

    byRarity_[item.rarity].push_back(index);
    byColor_[entry.colorProfile.dominant].push_back(index);
    LOG_DEBUG("Template '", item.id, "': ", entry.colorProfile.toString());
    entries_.insert_or_assign(item.id, std::move(entry));
}

TemplateStore::LoadReport TemplateStore::loadAll(const Domain::Catalog& catalog) {
    std::lock_guard<std::mutex> lock(loadMutex_);

    LoadReport report;
    if (loaded_.load()) {
        report.alreadyLoaded = true;
        return report;
    }

    auto startTime = std::chrono::steady_clock::now();

    std::vector<const Domain::ItemDescriptor*> pending;
    for (const auto& item : catalog.getItems()) {
        if (item.hasIcon()) {
            pending.push_back(&item);
        } else {
            ++report.skipped;
        }
    }
    report.attempted = static_cast<int>(pending.size());

    LOG_INFO("Loading templates for ", pending.size(), " items (", report.skipped, " without icon)");

    size_t concurrency = settings_.maxConcurrentLoads > 0
                             ? static_cast<size_t>(settings_.maxConcurrentLoads)
                             : std::max(1u, std::thread::hardware_concurrency());

    struct LoadOutcome {
        std::optional<Domain::TemplateEntry> entry;
        std::string error;
    };

    // Workers pull the next pending item, so one slow icon only holds its own worker.
    std::vector<LoadOutcome> outcomes(pending.size());
    std::atomic<size_t> next{0};
    auto work = [this, &pending, &outcomes, &next]() {
        for (size_t i = next.fetch_add(1); i < pending.size(); i = next.fetch_add(1)) {
            LoadOutcome& outcome = outcomes[i];
            try {
                outcome.entry = buildEntry(*pending[i]);
            } catch (const cv::Exception& e) {
                outcome.error = std::string("OpenCV error: ") + e.what();
            } catch (const std::exception& e) {
                outcome.error = e.what();
            }
        }
    };

    std::vector<std::future<void>> workers;
    const size_t workerCount = std::min(concurrency, pending.size());
    workers.reserve(workerCount);
    for (size_t w = 0; w < workerCount; ++w) {
        workers.push_back(std::async(std::launch::async, work));
    }
    for (auto& worker : workers) worker.get();

    // Indexing stays on this thread so the maps see a single writer.
    for (size_t i = 0; i < pending.size(); ++i) {
        const Domain::ItemDescriptor& item = *pending[i];
        if (outcomes[i].entry) {
            insert(item, std::move(*outcomes[i].entry));
            ++report.loaded;
        } else {
            LOG_ERROR("Failed to load template for '", item.id, "': ", outcomes[i].error);
            report.failedIds.push_back(item.id);
            ++report.failed;
        }
    }

    loaded_.store(true);

    auto endTime = std::chrono::steady_clock::now();
    report.loadTimeMs = std::chrono::duration<float, std::milli>(endTime - startTime).count();

    std::ostringstream rarityCounts;
    for (const auto& [rarity, indices] : byRarity_) {
        rarityCounts << " " << Types::toString(rarity) << "=" << indices.size();
    }
    LOG_INFO(report.getSummary(), "; by rarity:", rarityCounts.str());
    return report;
}

std::future<TemplateStore::LoadReport> TemplateStore::loadAllAsync(const Domain::Catalog& catalog) {
    return std::async(std::launch::async, [this, catalog]() { return loadAll(catalog); });
}

const Domain::TemplateEntry* TemplateStore::get(const std::string& itemId) const {
    auto it = entries_.find(itemId);
    return it == entries_.end() ? nullptr : &it->second;
}

const Domain::ItemDescriptor* TemplateStore::getItem(const std::string& itemId) const {
    auto it = indexById_.find(itemId);
    return it == indexById_.end() ? nullptr : &items_[it->second];
}

std::vector<const Domain::ItemDescriptor*> TemplateStore::resolve(const std::vector<size_t>& indices) const {
    std::vector<const Domain::ItemDescriptor*> result;
    result.reserve(indices.size());
    for (size_t index : indices) result.push_back(&items_[index]);
    return result;
}

std::vector<const Domain::ItemDescriptor*> TemplateStore::byRarity(Types::Rarity rarity) const {
    auto it = byRarity_.find(rarity);
    return it == byRarity_.end() ? std::vector<const Domain::ItemDescriptor*>{} : resolve(it->second);
}

std::vector<const Domain::ItemDescriptor*> TemplateStore::byColor(Types::ColorLabel color) const {
    auto it = byColor_.find(color);
    return it == byColor_.end() ? std::vector<const Domain::ItemDescriptor*>{} : resolve(it->second);
}

std::vector<const Domain::ItemDescriptor*> TemplateStore::allItems() const {
    std::vector<const Domain::ItemDescriptor*> result;
    result.reserve(items_.size());
    for (const auto& item : items_) result.push_back(&item);
    return result;
}

void TemplateStore::reset() {
    std::lock_guard<std::mutex> lock(loadMutex_);
    items_.clear();
    indexById_.clear();
    entries_.clear();
    byRarity_.clear();
    byColor_.clear();
    loaded_.store(false);
    LOG_DEBUG("Template store reset");
}

}  // namespace HotbarScan::Internal::Templates
