#include <catalog.hpp>
#include <logging.hpp>

#include <algorithm>
#include <fstream>

namespace NCafeBooking {

    namespace {

        template <class TMap>
        uint64_t NextId(const TMap& items) {
            return items.empty() ? 1 : items.rbegin()->first + 1;
        }

    } // namespace

    CafeId TMemoryCatalog::AddCafe(TCafe cafe) {
        std::lock_guard lk(Mutex_);
        if (cafe.Id == 0) {
            cafe.Id = NextId(Cafes);
        }
        Cafes[cafe.Id] = cafe;
        return cafe.Id;
    }

    TableId TMemoryCatalog::AddTable(TTable table) {
        if (table.Seats < MIN_TABLE_SEATS || table.Seats > MAX_TABLE_SEATS) {
            throw TBookingError(EErrorCode::InvalidSeatsCount, std::to_string(table.Seats));
        }
        std::lock_guard lk(Mutex_);
        if (Cafes.find(table.Cafe) == Cafes.end()) {
            throw TBookingError(EErrorCode::CafeNotFound, std::to_string(table.Cafe));
        }
        if (table.Id == 0) {
            table.Id = NextId(Tables);
        }
        Tables[table.Id] = table;
        return table.Id;
    }

    SlotId TMemoryCatalog::AddSlot(TSlot slot) {
        slot.Interval = TTimeInterval::Make(slot.Interval.Start, slot.Interval.End);
        std::lock_guard lk(Mutex_);
        if (Cafes.find(slot.Cafe) == Cafes.end()) {
            throw TBookingError(EErrorCode::CafeNotFound, std::to_string(slot.Cafe));
        }
        if (slot.Active) {
            for (const auto& [id, other] : Slots) {
                if (other.Cafe == slot.Cafe && other.Active && id != slot.Id && other.Interval.Overlaps(slot.Interval)) {
                    throw TBookingError(EErrorCode::SlotOverlap,
                                        slot.Interval.ToString() + " overlaps slot " + std::to_string(id));
                }
            }
        }
        if (slot.Id == 0) {
            slot.Id = NextId(Slots);
        }
        Slots[slot.Id] = slot;
        return slot.Id;
    }

    void TMemoryCatalog::SetCafeActive(CafeId id, bool active) {
        std::lock_guard lk(Mutex_);
        auto it = Cafes.find(id);
        if (it == Cafes.end()) {
            throw TBookingError(EErrorCode::CafeNotFound, std::to_string(id));
        }
        it->second.Active = active;
    }

    void TMemoryCatalog::SetTableActive(TableId id, bool active) {
        std::lock_guard lk(Mutex_);
        auto it = Tables.find(id);
        if (it == Tables.end()) {
            throw TBookingError(EErrorCode::TableNotFound, std::to_string(id));
        }
        it->second.Active = active;
    }

    void TMemoryCatalog::SetSlotActive(SlotId id, bool active) {
        std::lock_guard lk(Mutex_);
        auto it = Slots.find(id);
        if (it == Slots.end()) {
            throw TBookingError(EErrorCode::SlotNotFound, std::to_string(id));
        }
        it->second.Active = active;
    }

    std::optional<TCafe> TMemoryCatalog::GetCafe(CafeId id) const {
        std::lock_guard lk(Mutex_);
        auto it = Cafes.find(id);
        if (it == Cafes.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<TTable> TMemoryCatalog::GetTable(TableId id) const {
        std::lock_guard lk(Mutex_);
        auto it = Tables.find(id);
        if (it == Tables.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<TSlot> TMemoryCatalog::GetSlot(SlotId id) const {
        std::lock_guard lk(Mutex_);
        auto it = Slots.find(id);
        if (it == Slots.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<TSlot> TMemoryCatalog::ListSlots(CafeId cafe) const {
        std::lock_guard lk(Mutex_);
        std::vector<TSlot> out;
        for (const auto& kv : Slots) {
            if (kv.second.Cafe == cafe) {
                out.push_back(kv.second);
            }
        }
        std::sort(out.begin(), out.end(), [](const TSlot& a, const TSlot& b) {
            return a.Interval.Start < b.Interval.Start;
        });
        return out;
    }

    void FillCatalogFromJson(TMemoryCatalog& catalog, const json& j) {
        if (!j.is_object()) {
            throw std::runtime_error("Catalog must be a JSON object");
        }
        for (const auto& c : j.value("cafes", json::array())) {
            TCafe cafe;
            cafe.Id = c.at("id").get<CafeId>();
            cafe.Name = c.value("name", "");
            cafe.Active = c.value("active", true);
            catalog.AddCafe(cafe);
        }
        for (const auto& t : j.value("tables", json::array())) {
            TTable table;
            table.Id = t.at("id").get<TableId>();
            table.Cafe = t.at("cafe_id").get<CafeId>();
            table.Seats = t.at("seats").get<int>();
            table.Description = t.value("description", "");
            table.Active = t.value("active", true);
            catalog.AddTable(table);
        }
        for (const auto& s : j.value("slots", json::array())) {
            TSlot slot;
            slot.Id = s.at("id").get<SlotId>();
            slot.Cafe = s.at("cafe_id").get<CafeId>();
            slot.Interval = TTimeInterval{ParseTime(s.at("start").get<std::string>()),
                                          ParseTime(s.at("end").get<std::string>())};
            slot.Active = s.value("active", true);
            catalog.AddSlot(slot);
        }
    }

    std::shared_ptr<TMemoryCatalog> LoadCatalogFromJson(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("Cannot open catalog file: " + path);
        }
        json j = json::parse(in);
        auto catalog = std::make_shared<TMemoryCatalog>();
        FillCatalogFromJson(*catalog, j);
        LogInfo("catalog", "catalog loaded", {{"path", path}});
        return catalog;
    }

} // namespace NCafeBooking
