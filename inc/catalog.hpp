#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "models.hpp"

namespace NCafeBooking {

    constexpr int MIN_TABLE_SEATS = 1;
    constexpr int MAX_TABLE_SEATS = 100;

    // Read side of cafe, table and slot data consumed by booking checks.
    struct ICatalog {
        virtual ~ICatalog() = default;
        virtual std::optional<TCafe> GetCafe(CafeId id) const = 0;
        virtual std::optional<TTable> GetTable(TableId id) const = 0;
        virtual std::optional<TSlot> GetSlot(SlotId id) const = 0;
        virtual std::vector<TSlot> ListSlots(CafeId cafe) const = 0;
    };

    // Zero ids are assigned on insert.
    class TMemoryCatalog: public ICatalog {
    public:
        CafeId AddCafe(TCafe cafe);
        TableId AddTable(TTable table);
        SlotId AddSlot(TSlot slot);

        void SetCafeActive(CafeId id, bool active);
        void SetTableActive(TableId id, bool active);
        void SetSlotActive(SlotId id, bool active);

        std::optional<TCafe> GetCafe(CafeId id) const override;
        std::optional<TTable> GetTable(TableId id) const override;
        std::optional<TSlot> GetSlot(SlotId id) const override;
        std::vector<TSlot> ListSlots(CafeId cafe) const override;

    private:
        mutable std::mutex Mutex_;
        std::map<CafeId, TCafe> Cafes;
        std::map<TableId, TTable> Tables;
        std::map<SlotId, TSlot> Slots;
    };

    // Reads {"cafes": [...], "tables": [...], "slots": [...]}.
    std::shared_ptr<TMemoryCatalog> LoadCatalogFromJson(const std::string& path);
    void FillCatalogFromJson(TMemoryCatalog& catalog, const json& j);

} // namespace NCafeBooking
