#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "dispatch/UiState.hpp"

using namespace dispatch;

namespace {

UiMutation mutation(UiCommand command) {
    return UiMutation{std::move(command), "test"};
}

}  // namespace

TEST_CASE("UiState - response views", "[dispatch][ui]") {
    UiState ui(100);
    const ViewId id = 7;

    ui.apply(mutation(BeginExchange{id, "GET", "https://example.com/"}));

    SECTION("Begin puts the view in Loading") {
        auto view = ui.view(id);
        REQUIRE(view);
        REQUIRE(view->state == ViewState::Loading);
        REQUIRE(view->method == "GET");
        REQUIRE(view->url == "https://example.com/");
    }

    SECTION("Head and slices build the text in order") {
        ui.apply(mutation(ShowResponseHead{id, "HEAD\n"}));
        ui.apply(mutation(AppendBodySlice{id, "one"}));
        ui.apply(mutation(AppendBodySlice{id, "two"}));
        REQUIRE(ui.view(id)->text() == "HEAD\nonetwo");
    }

    SECTION("Oldest slices are trimmed past the display limit") {
        ui.apply(mutation(ShowResponseHead{id, "HEAD\n"}));
        ui.apply(mutation(AppendBodySlice{id, std::string(60, 'a')}));
        ui.apply(mutation(AppendBodySlice{id, std::string(60, 'b')}));
        auto view = ui.view(id);
        REQUIRE(view->body_slices.size() == 1);
        REQUIRE(view->displayed_bytes == 60);
        REQUIRE(view->text() == "HEAD\n" + std::string(60, 'b'));
    }

    SECTION("A single oversized slice stays visible") {
        ui.apply(mutation(AppendBodySlice{id, std::string(500, 'z')}));
        REQUIRE(ui.view(id)->body_slices.size() == 1);
    }

    SECTION("Completion records the summary") {
        ui.apply(mutation(CompleteExchange{id, 201, std::chrono::milliseconds(12), 345, true}));
        auto view = ui.view(id);
        REQUIRE(view->state == ViewState::Completed);
        REQUIRE(view->status_code == 201);
        REQUIRE(view->byte_size == 345);
        REQUIRE(view->truncated);
    }

    SECTION("Replace body wins over streamed slices") {
        ui.apply(mutation(AppendBodySlice{id, "{\"a\":1}"}));
        ui.apply(mutation(ReplaceBody{id, "HEAD\n{\n  \"a\": 1\n}"}));
        REQUIRE(ui.view(id)->text() == "HEAD\n{\n  \"a\": 1\n}");
    }

    SECTION("Cancelled failure maps to Cancelled state") {
        ui.apply(mutation(FailExchange{id, http::ErrorKind::Cancelled, "Request was cancelled.",
                                       "Request was cancelled.", std::chrono::milliseconds(3)}));
        auto view = ui.view(id);
        REQUIRE(view->state == ViewState::Cancelled);
        REQUIRE(view->text() == "Request was cancelled.");
    }

    SECTION("Transport failure maps to Failed state") {
        ui.apply(mutation(FailExchange{id, http::ErrorKind::TransportError, "refused", "Error: refused",
                                       std::chrono::milliseconds(3)}));
        REQUIRE(ui.view(id)->state == ViewState::Failed);
        REQUIRE(ui.view(id)->error == "refused");
    }

    SECTION("Unknown view is absent") {
        REQUIRE_FALSE(ui.view(999));
    }
}

TEST_CASE("UiState - status text and notices", "[dispatch][ui]") {
    UiState ui(1024, 3);

    SECTION("Status text") {
        ui.apply(mutation(SetStatusText{"Sending..."}));
        REQUIRE(ui.statusText() == "Sending...");
        REQUIRE(ui.appliedCount() == 1);
    }

    SECTION("Notices are bounded and forwarded") {
        std::vector<std::string> seen;
        ui.setNoticeHandler([&seen](const Notice& n) { seen.push_back(n.title); });

        for (int i = 0; i < 5; ++i)
            ui.deliverNotice(Notice{"n" + std::to_string(i), "", true});

        auto kept = ui.notices();
        REQUIRE(kept.size() == 3);
        REQUIRE(kept.front().title == "n2");
        REQUIRE(kept.back().title == "n4");
        REQUIRE(seen.size() == 5);
    }
}
