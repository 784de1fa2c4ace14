#include "store.hpp"

namespace wacast {

bool parse_recipient_selection(const std::string& name, RecipientSelection& out) {
    if (name.empty() || name == "all") {
        out = RecipientSelection::All;
    } else if (name == "pending") {
        out = RecipientSelection::Pending;
    } else if (name == "selected") {
        out = RecipientSelection::Selected;
    } else {
        return false;
    }
    return true;
}

} // namespace wacast
