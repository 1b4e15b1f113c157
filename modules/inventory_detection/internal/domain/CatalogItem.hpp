#pragma once

#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <opencv2/opencv.hpp>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace HotbarScan::Domain {

struct ItemDescriptor {
    std::string id;
    std::string name;
    Types::Rarity rarity = Types::Rarity::COMMON;
    std::string iconPath;  // empty when the item has no icon

    bool hasIcon() const { return !iconPath.empty(); }
};

// Ordered list of known items, keyed by unique id.
class Catalog {
  public:
    Catalog() = default;
    explicit Catalog(std::vector<ItemDescriptor> items) {
        for (auto& item : items) addItem(std::move(item));
    }

    // A repeated id replaces the earlier descriptor in place.
    void addItem(ItemDescriptor item) {
        auto existing = indexById_.find(item.id);
        if (existing != indexById_.end()) {
            LOG_WARN("Duplicate catalog id '", item.id, "', keeping the later entry");
            items_[existing->second] = std::move(item);
            return;
        }
        indexById_[item.id] = items_.size();
        items_.push_back(std::move(item));
    }

    const std::vector<ItemDescriptor>& getItems() const { return items_; }
    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    const ItemDescriptor* find(const std::string& id) const {
        auto it = indexById_.find(id);
        return it == indexById_.end() ? nullptr : &items_[it->second];
    }

    // Reads `items: [{id, name, rarity, image}]` from a YAML, JSON or XML document.
    // Relative image paths are resolved against the catalog's directory.
    bool loadFromFile(const std::string& filename) {
        try {
            cv::FileStorage fs(filename, cv::FileStorage::READ);
            if (!fs.isOpened()) {
                LOG_ERROR("Cannot open catalog file for reading: ", filename);
                return false;
            }

            cv::FileNode itemsNode = fs["items"];
            if (itemsNode.empty() || !itemsNode.isSeq()) {
                LOG_ERROR("Catalog file has no 'items' sequence: ", filename);
                return false;
            }

            std::filesystem::path baseDir = std::filesystem::path(filename).parent_path();
            int skipped = 0;

            for (auto it = itemsNode.begin(); it != itemsNode.end(); ++it) {
                cv::FileNode node = *it;
                ItemDescriptor item;
                std::string rarityName;
                node["id"] >> item.id;
                node["name"] >> item.name;
                node["rarity"] >> rarityName;
                node["image"] >> item.iconPath;

                if (item.id.empty()) {
                    ++skipped;
                    continue;
                }
                if (item.name.empty()) item.name = item.id;

                item.rarity = Types::rarityFromString(rarityName);
                if (item.rarity == Types::Rarity::UNKNOWN) {
                    LOG_WARN("Item '", item.id, "' has unrecognised rarity '", rarityName, "'");
                }

                if (!item.iconPath.empty()) {
                    std::filesystem::path iconPath(item.iconPath);
                    if (iconPath.is_relative()) {
                        item.iconPath = (baseDir / iconPath).lexically_normal().string();
                    }
                }

                addItem(std::move(item));
            }

            fs.release();

            if (skipped > 0) {
                LOG_WARN("Skipped ", skipped, " catalog entries without an id");
            }
            LOG_INFO("Catalog loaded from ", filename, ": ", items_.size(), " items");
            return true;

        } catch (const cv::Exception& e) {
            LOG_ERROR("OpenCV error while loading catalog: ", e.what());
            return false;
        }
    }

  private:
    std::vector<ItemDescriptor> items_;
    std::unordered_map<std::string, size_t> indexById_;
};

}  // namespace HotbarScan::Domain
