#include <BookingManager.hpp>
#include <FileJsonStorage.hpp>
#include <logging.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>

using namespace NCafeBooking;

namespace {

    std::vector<TTableSlot> ParseTableSlots(const std::string& arg) {
        std::vector<TTableSlot> out;
        std::istringstream iss(arg);
        std::string item;
        while (std::getline(iss, item, ',')) {
            auto colon = item.find(':');
            if (colon == std::string::npos) {
                throw TBookingError(EErrorCode::ValidationError, "expected <table>:<slot>, got '" + item + "'");
            }
            out.push_back(TTableSlot{std::stoull(item.substr(0, colon)), std::stoull(item.substr(colon + 1))});
        }
        return out;
    }

    std::string RestOfLine(std::istringstream& iss) {
        std::string rest;
        std::getline(iss, rest);
        auto first = rest.find_first_not_of(' ');
        return first == std::string::npos ? std::string() : rest.substr(first);
    }

    void PrintBooking(const TBooking& b) {
        std::cout << "id=" << b.Id << " cafe=" << b.Cafe << " date=" << FormatDate(b.Date)
                  << " guests=" << b.GuestNumber << " status=" << StatusName(b.Status)
                  << " active=" << (b.Active ? "yes" : "no") << " owner=" << b.Owner << " slots=";
        for (size_t i = 0; i < b.TableSlots.size(); ++i) {
            std::cout << (i ? "," : "") << b.TableSlots[i].Table << ":" << b.TableSlots[i].Slot;
        }
        if (!b.Note.empty()) {
            std::cout << " note=\"" << b.Note << "\"";
        }
        std::cout << "\n";
    }

    TConfig ReadConfig(int argc, char** argv) {
        std::string path;
        if (argc > 1) {
            path = argv[1];
        } else if (const char* env = std::getenv("CAFEBOOKING_CONFIG")) {
            path = env;
        }
        if (path.empty()) {
            return TConfig{};
        }
        return LoadConfig(path);
    }

} // namespace

int main(int argc, char** argv) {
    TConfig config;
    std::shared_ptr<TMemoryCatalog> catalog;
    std::shared_ptr<TBookingRepository> repo;
    try {
        config = ReadConfig(argc, argv);
        SetLogLevel(config.LogLevel);
        catalog = config.CatalogPath.empty() ? std::make_shared<TMemoryCatalog>()
                                             : LoadCatalogFromJson(config.CatalogPath);
        std::shared_ptr<IStorage> storage;
        if (config.SnapshotPath.empty()) {
            storage = std::make_shared<TMemoryStorage>();
        } else {
            storage = std::make_shared<TFileJsonStorage>(config.SnapshotPath, config.JournalPath);
        }
        // Reads the snapshot and replays the journal; corrupt state fails here.
        repo = std::make_shared<TBookingRepository>(storage, catalog, static_cast<size_t>(config.CompactEvery));
    } catch (const std::exception& ex) {
        std::cerr << "Startup failed: " << ex.what() << "\n";
        return 1;
    }

    auto notifier = std::make_shared<TQueuedNotifier>(std::make_shared<TLoggingNotifier>());
    auto clock = std::make_shared<TSystemClock>();

    TBookingManager mgr(catalog, repo, notifier, clock, config.Rules);

    std::cout << "Cafe booking CLI. Commands:\n"
              << "  login <id> <name> <role:customer|manager|admin>\n"
              << "  cafe <name>                           -- add a cafe\n"
              << "  table <cafe> <seats> [description]    -- add a table\n"
              << "  slot <cafe> <HH:MM> <HH:MM>           -- add a time slot\n"
              << "  book <cafe> <YYYY-MM-DD> <guests> <table:slot>[,<table:slot>...] [note]\n"
              << "  status <id> <pending|confirmed|cancelled|completed>\n"
              << "  move <id> <YYYY-MM-DD>\n"
              << "  guests <id> <n>\n"
              << "  slots <id> <table:slot>[,<table:slot>...]\n"
              << "  show <id>\n"
              << "  list [cafe]\n"
              << "  sweep                                 -- complete past bookings\n"
              << "  exit\n";

    TActor current{0, "guest", ERole::Customer};

    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) {
            break;
        }
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd)) {
            continue;
        }
        if (cmd == "exit") {
            break;
        }

        try {
            if (cmd == "login") {
                UserId id;
                std::string name;
                std::string role;
                iss >> id >> name >> role;
                auto r = ParseRole(role);
                if (!iss || !r) {
                    std::cout << "Usage: login <id> <name> <customer|manager|admin>\n";
                    continue;
                }
                current = TActor{id, name, *r};
                std::cout << "Logged in as " << name << " role=" << RoleName(*r) << "\n";
                continue;
            }

            if (cmd == "cafe") {
                std::string name = RestOfLine(iss);
                auto id = catalog->AddCafe(TCafe{0, name, true});
                std::cout << "Cafe id=" << id << "\n";
                continue;
            }

            if (cmd == "table") {
                TTable t;
                iss >> t.Cafe >> t.Seats;
                if (!iss) {
                    std::cout << "Usage: table <cafe> <seats> [description]\n";
                    continue;
                }
                t.Description = RestOfLine(iss);
                std::cout << "Table id=" << catalog->AddTable(t) << "\n";
                continue;
            }

            if (cmd == "slot") {
                TSlot s;
                std::string from;
                std::string to;
                iss >> s.Cafe >> from >> to;
                if (!iss) {
                    std::cout << "Usage: slot <cafe> <HH:MM> <HH:MM>\n";
                    continue;
                }
                s.Interval = TTimeInterval{ParseTime(from), ParseTime(to)};
                std::cout << "Slot id=" << catalog->AddSlot(s) << "\n";
                continue;
            }

            if (cmd == "book") {
                TCreateRequest req;
                std::string date;
                std::string slots;
                iss >> req.Cafe >> date >> req.GuestNumber >> slots;
                if (!iss) {
                    std::cout << "Usage: book <cafe> <YYYY-MM-DD> <guests> <table:slot>[,...] [note]\n";
                    continue;
                }
                req.Date = ParseDate(date);
                req.TableSlots = ParseTableSlots(slots);
                req.Note = RestOfLine(iss);
                req.Actor = current;
                PrintBooking(mgr.CreateBooking(req));
                continue;
            }

            if (cmd == "status" || cmd == "move" || cmd == "guests" || cmd == "slots") {
                BookingId id;
                std::string value;
                iss >> id >> value;
                if (!iss) {
                    std::cout << "Usage: " << cmd << " <id> <value>\n";
                    continue;
                }
                TBookingPatch patch;
                if (cmd == "status") {
                    auto status = ParseStatus(value);
                    if (!status) {
                        std::cout << "Unknown status " << value << "\n";
                        continue;
                    }
                    patch.Status = *status;
                } else if (cmd == "move") {
                    patch.Date = ParseDate(value);
                } else if (cmd == "guests") {
                    patch.GuestNumber = std::stoi(value);
                } else {
                    patch.TableSlots = ParseTableSlots(value);
                }
                PrintBooking(mgr.UpdateBooking(id, patch, current));
                continue;
            }

            if (cmd == "show") {
                BookingId id;
                iss >> id;
                if (!iss) {
                    std::cout << "Usage: show <id>\n";
                    continue;
                }
                PrintBooking(mgr.GetBooking(id, current));
                continue;
            }

            if (cmd == "list") {
                TBookingListQuery query;
                CafeId cafe;
                if (iss >> cafe) {
                    query.Cafe = cafe;
                }
                for (const auto& b : mgr.ListBookings(current, query)) {
                    PrintBooking(b);
                }
                continue;
            }

            if (cmd == "sweep") {
                std::cout << "Completed " << mgr.CompleteExpiredBookings() << " expired bookings\n";
                continue;
            }

            std::cout << "Unknown command\n";
        } catch (const TBookingError& ex) {
            std::cout << "Error [" << ErrorKindName(ex.Kind()) << "]: " << ex.what() << "\n";
        } catch (const std::exception& ex) {
            std::cout << "Error: " << ex.what() << "\n";
        }
    }

    notifier->Flush();
    return 0;
}
