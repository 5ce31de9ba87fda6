#include "indicator_host.h"

void apply_display_state(IndicatorHost& host, const DisplayState& state) {
    static const MenuItemId kDataItems[] = {
        MenuItemId::Session,
        MenuItemId::SessionReset,
        MenuItemId::Weekly,
        MenuItemId::WeeklyReset,
        MenuItemId::Status,
        MenuItemId::LastUpdate,
        MenuItemId::NextUpdate,
    };

    host.set_title(state.title);
    for (MenuItemId id : kDataItems) {
        host.set_item_text(id, state.item_text(id));
    }
}
