// main.cpp - Patch-driven document store example

#include <json_delta/diff.h>
#include <json_delta/patch.h>
#include <json_delta/patch_codec.h>
#include <json_delta/pointer_lens.h>
#include <json_delta/serialization.h>
#include <json_delta/value.h>

#include <immer/vector.hpp>
#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <iostream>
#include <string>
#include <variant>

using namespace json_delta;

// ============================================================
// Application State and Actions
// ============================================================

struct ApplyPatch
{
    Patch patch;
};

struct Undo {};
struct Redo {};

using Action = std::variant<ApplyPatch, Undo, Redo>;

struct AppState
{
    Value document;
    immer::vector<Value> history;
    immer::vector<Value> future;
    std::string last_error;
};

AppState create_initial_state()
{
    return AppState{
        .document   = from_json(R"({"title": "Groceries", "items": [{"name": "milk", "done": false}]})"),
        .history    = immer::vector<Value>{},
        .future     = immer::vector<Value>{},
        .last_error = {},
    };
}

// ============================================================
// Reducer
// ============================================================

AppState reducer(AppState state, Action action)
{
    return std::visit(
        [&](auto&& act) -> AppState {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, Undo>) {
                if (state.history.empty())
                    return state;

                auto new_state     = state;
                new_state.future   = new_state.future.push_back(new_state.document);
                new_state.document = new_state.history.back();
                new_state.history  = new_state.history.take(new_state.history.size() - 1);
                return new_state;

            } else if constexpr (std::is_same_v<T, Redo>) {
                if (state.future.empty())
                    return state;

                auto new_state     = state;
                new_state.history  = new_state.history.push_back(new_state.document);
                new_state.document = new_state.future.back();
                new_state.future   = new_state.future.take(new_state.future.size() - 1);
                return new_state;

            } else {
                auto result = apply(act.patch, state.document);
                auto new_state = state;
                if (!result) {
                    // Failed patches leave the document as it was
                    new_state.last_error = error_to_string(*result.error);
                    return new_state;
                }
                new_state.last_error.clear();
                new_state.history  = new_state.history.push_back(state.document);
                new_state.future   = immer::vector<Value>{};
                new_state.document = std::move(result.value);
                return new_state;
            }
        },
        action);
}

// ============================================================
// Main Application
// ============================================================

namespace {

void print_state(const AppState& state)
{
    std::cout << to_json(state.document) << "\n";
    if (!state.last_error.empty()) {
        std::cout << "  last error: " << state.last_error << "\n";
    }
    std::cout << "  history: " << state.history.size() << ", future: " << state.future.size() << "\n\n";
}

} // namespace

int main()
{
    auto loop  = lager::with_manual_event_loop{};
    auto store = lager::make_store<Action>(
        create_initial_state(),
        loop,
        lager::with_reducer(reducer)
    );

    std::cout << "=== Initial document ===\n";
    print_state(store.get());

    // A patch as it would arrive over the wire
    auto incoming = parse_patch(R"([
        {"op": "add",     "path": "/items/-", "value": {"name": "eggs", "done": false}},
        {"op": "replace", "path": "/items/0/done", "value": true},
        {"op": "copy",    "from": "/title", "path": "/subtitle"}
    ])");
    if (!incoming) {
        std::cerr << "cannot decode patch: " << *incoming.error << "\n";
        return 1;
    }

    std::cout << "=== Apply incoming patch ===\n";
    for (const auto& op : incoming.value) {
        std::cout << "  " << to_string(op) << "\n";
    }
    store.dispatch(ApplyPatch{incoming.value});
    print_state(store.get());

    std::cout << "=== Apply a patch guarded by a failing test ===\n";
    store.dispatch(ApplyPatch{Patch{
        TestOp{Pointer{"title"}, Value{"Hardware"}},
        RemoveOp{Pointer{"items"}},
    }});
    print_state(store.get());

    std::cout << "=== Edit through a pointer lens ===\n";
    auto second_name = pointer_lens(Pointer{"items", "1", "name"});
    Value edited = lager::set(second_name, store.get().document, Value{"free-range eggs"});

    // Ship the edit as a minimal patch instead of the whole document
    LcsArrayDiff lcs;
    Patch delta = diff(lcs, edited, store.get().document);
    std::cout << "  diff: " << to_json(encode_patch(delta), true) << "\n";
    store.dispatch(ApplyPatch{delta});
    print_state(store.get());

    std::cout << "=== Undo twice, redo once ===\n";
    store.dispatch(Undo{});
    store.dispatch(Undo{});
    store.dispatch(Redo{});
    print_state(store.get());

    return 0;
}
