// =============================================================================
// Unit tests for CardRecognizer (src/ai/card_recognizer.hpp)
// Synthetic 200x100 frames: three noisy 40x40 slots, optional gold strip
// =============================================================================
#include <gtest/gtest.h>
#include "ai/card_recognizer.hpp"
#include "event_bus.hpp"
#include "synthetic_frames.hpp"

using namespace autopick;
using namespace autopick::ai;
using test::ShopFrame;
namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Color heuristics
// ---------------------------------------------------------------------------
TEST(CardRecognizerColorTest, EstimateCostPicksDominantBand) {
    EXPECT_EQ(CardRecognizer::estimateCost(Image(10, 10, 128, 255, 0)), 1);    // chartreuse
    EXPECT_EQ(CardRecognizer::estimateCost(Image(10, 10, 255, 200, 0)), 2);    // gold
    EXPECT_EQ(CardRecognizer::estimateCost(Image(10, 10, 255, 80, 80)), 3);    // red
    EXPECT_EQ(CardRecognizer::estimateCost(Image(10, 10, 128, 0, 255)), 4);    // purple
    EXPECT_EQ(CardRecognizer::estimateCost(Image(10, 10, 240, 240, 240)), 5);  // white
}

TEST(CardRecognizerColorTest, EstimateCostMajorityAndFallback) {
    Image img(10, 10, 240, 240, 240);          // 100 white
    img.fill(Rect{0, 0, 10, 6}, 128, 0, 255);  // 60 purple, 40 white
    EXPECT_EQ(CardRecognizer::estimateCost(img), 4);

    EXPECT_EQ(CardRecognizer::estimateCost(Image(10, 10, 0, 0, 0)), 1);  // no band
    EXPECT_EQ(CardRecognizer::estimateCost(Image{}), 1);
}

TEST(CardRecognizerColorTest, CurrencyRatio) {
    Image img(10, 10, 0, 0, 0);
    EXPECT_DOUBLE_EQ(CardRecognizer::currencyRatio(img), 0.0);
    img.fill(Rect{0, 0, 10, 1}, 255, 200, 0);
    EXPECT_DOUBLE_EQ(CardRecognizer::currencyRatio(img), 0.1);
    EXPECT_DOUBLE_EQ(CardRecognizer::currencyRatio(Image{}), 0.0);
}

TEST(CardRecognizerColorTest, DefaultShopRegions) {
    auto regions = defaultShopRegions();
    ASSERT_EQ(regions.size(), 5u);
    EXPECT_EQ(regions[0], (Rect{200, 500, 150, 200}));
    EXPECT_EQ(regions[4], (Rect{1000, 500, 150, 200}));
    EXPECT_EQ(regions[2].centerX(), 675);
    EXPECT_EQ(regions[2].centerY(), 600);
}

// ---------------------------------------------------------------------------
// Pipeline fixture
// ---------------------------------------------------------------------------
class CardRecognizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg_.shop_regions = {ShopFrame::slot(0), ShopFrame::slot(1), ShopFrame::slot(2)};
        lib_.registerImage("alpha", ShopFrame::slotImage(0), "card_s13_c2");
        lib_.registerImage("beta", ShopFrame::slotImage(1), "card_s13_c4");
        // slot 2 has no template; "gamma" belongs to another season
        lib_.registerImage("gamma", ShopFrame::slotImage(2), "card_s12_c1");
    }

    log::MemorySink sink_;
    EventBus bus_{sink_};
    TemplateLibrary lib_{sink_};
    TemplateMatcher matcher_{lib_, sink_};
    FrameScreenSource screen_;
    RecognizerConfig cfg_;
};

TEST_F(CardRecognizerTest, ShoppingFrameRecognizesSeasonCards) {
    screen_.setFrame(ShopFrame::make(true));
    CardRecognizer rec(screen_, lib_, matcher_, sink_, &bus_, cfg_);
    rec.setCardCatalog({{"alpha", {"Mage", "Arcana"}}});

    auto r = rec.refreshAndRecognize();
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    const auto& cards = r.value();
    ASSERT_EQ(cards.size(), 2u);

    EXPECT_EQ(cards[0].name, "alpha");
    EXPECT_GT(cards[0].confidence, 0.7f);
    EXPECT_EQ(cards[0].x, ShopFrame::slot(0).centerX());
    EXPECT_EQ(cards[0].y, ShopFrame::slot(0).centerY());
    ASSERT_TRUE(cards[0].shop_index.has_value());
    EXPECT_EQ(*cards[0].shop_index, 0);
    EXPECT_EQ(cards[0].classes.count("Mage"), 1u);

    EXPECT_EQ(cards[1].name, "beta");
    EXPECT_EQ(*cards[1].shop_index, 1);
    EXPECT_TRUE(cards[1].classes.empty());
    EXPECT_NE(cards[1].rarity, CardRarity::Unknown);

    EXPECT_EQ(rec.gameState().phase, GamePhase::Shopping);
    EXPECT_TRUE(rec.gameState().is_active);
    EXPECT_EQ(rec.gameState().cards.size(), 2u);
}

TEST_F(CardRecognizerTest, LobbySkipsSlotCapture) {
    screen_.setFrame(ShopFrame::make(false));
    CardRecognizer rec(screen_, lib_, matcher_, sink_, &bus_, cfg_);

    auto r = rec.refreshAndRecognize();
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value().empty());
    EXPECT_EQ(rec.gameState().phase, GamePhase::Lobby);
    EXPECT_FALSE(rec.gameState().is_active);
    EXPECT_EQ(screen_.captureCalls(), 1);   // full snapshot only
}

TEST_F(CardRecognizerTest, EmptyCaptureIsRecognitionFailure) {
    CardRecognizer rec(screen_, lib_, matcher_, sink_, &bus_, cfg_);
    auto r = rec.refreshAndRecognize();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::Recognition);
    EXPECT_EQ(rec.gameState().phase, GamePhase::Unknown);
}

// ---------------------------------------------------------------------------
// Card list is replaced each pass; leaving the shop clears it
// ---------------------------------------------------------------------------
TEST_F(CardRecognizerTest, CardListReplacedWholesale) {
    screen_.setFrame(ShopFrame::make(true));
    CardRecognizer rec(screen_, lib_, matcher_, sink_, &bus_, cfg_);
    ASSERT_TRUE(rec.refreshAndRecognize().is_ok());
    rec.gameState().cards[0].select();

    ASSERT_TRUE(rec.refreshAndRecognize().is_ok());
    ASSERT_EQ(rec.gameState().cards.size(), 2u);
    EXPECT_FALSE(rec.gameState().cards[0].selected);

    screen_.setFrame(ShopFrame::make(false));
    ASSERT_TRUE(rec.refreshAndRecognize().is_ok());
    EXPECT_TRUE(rec.gameState().cards.empty());
}

TEST_F(CardRecognizerTest, PhaseChangePublishedOnce) {
    int changes = 0;
    GamePhase last = GamePhase::Unknown;
    auto sub = bus_.subscribe<PhaseChangeEvent>([&](const PhaseChangeEvent& e) {
        changes++;
        last = e.new_phase;
    });

    screen_.setFrame(ShopFrame::make(true));
    CardRecognizer rec(screen_, lib_, matcher_, sink_, &bus_, cfg_);
    auto t0 = std::chrono::steady_clock::time_point(std::chrono::seconds(5));
    rec.refreshAndRecognize(t0);
    rec.refreshAndRecognize(t0 + std::chrono::seconds(1));
    EXPECT_EQ(changes, 1);
    EXPECT_EQ(last, GamePhase::Shopping);
    EXPECT_EQ(*rec.gameState().last_phase_change, t0);
}

TEST_F(CardRecognizerTest, EmptySlotCaptureIsSkipped) {
    screen_.setFrame(ShopFrame::make(true));
    cfg_.shop_regions.push_back(Rect{500, 500, 40, 40});   // outside the frame
    CardRecognizer rec(screen_, lib_, matcher_, sink_, &bus_, cfg_);

    auto r = rec.refreshAndRecognize();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().size(), 2u);
}

TEST_F(CardRecognizerTest, CardPositionFallsBackToSlotCenter) {
    CardRecognizer rec(screen_, lib_, matcher_, sink_, &bus_, cfg_);
    Card placed("x");
    placed.setPosition(7, 9);
    EXPECT_EQ(rec.cardPosition(placed), std::make_pair(7, 9));

    Card slotted("y");
    slotted.shop_index = 1;
    EXPECT_EQ(rec.cardPosition(slotted),
              std::make_pair(ShopFrame::slot(1).centerX(), ShopFrame::slot(1).centerY()));

    Card loose("z");
    EXPECT_EQ(rec.cardPosition(loose), std::make_pair(0, 0));
    loose.shop_index = 99;
    EXPECT_EQ(rec.cardPosition(loose), std::make_pair(0, 0));
}

TEST_F(CardRecognizerTest, StatsSnapshot) {
    screen_.setFrame(ShopFrame::make(true));
    CardRecognizer rec(screen_, lib_, matcher_, sink_, &bus_, cfg_);
    rec.refreshAndRecognize();

    RecognizerStats s = rec.stats();
    EXPECT_EQ(s.template_count, 3u);
    EXPECT_EQ(s.slot_count, 3u);
    EXPECT_EQ(s.recognized_count, 2u);
    EXPECT_EQ(s.phase, GamePhase::Shopping);
    EXPECT_TRUE(s.active);
    EXPECT_EQ(s.season, "s13");

    rec.setShopRegions({ShopFrame::slot(0)});
    EXPECT_EQ(rec.stats().slot_count, 1u);
}

// ---------------------------------------------------------------------------
// Season layout on disk: <dir>/<season>/<cost>/ + <dir>/general/
// ---------------------------------------------------------------------------
TEST_F(CardRecognizerTest, SeasonLoadAndSwitch) {
    fs::path root = test::freshTempDir("season_templates");
    fs::create_directories(root / "s13" / "2");
    fs::create_directories(root / "s13" / "5");
    fs::create_directories(root / "general");
    ASSERT_TRUE(writeImagePng((root / "s13" / "2" / "alpha.png").string(),
                              ShopFrame::slotImage(0)).is_ok());
    ASSERT_TRUE(writeImagePng((root / "s13" / "5" / "omega.png").string(),
                              ShopFrame::slotImage(1)).is_ok());
    ASSERT_TRUE(writeImagePng((root / "general" / "reroll.png").string(),
                              test::noiseImage(12, 12, 4)).is_ok());

    TemplateLibrary lib(sink_);
    TemplateMatcher matcher(lib, sink_);
    RecognizerConfig cfg = cfg_;
    cfg.templates_dir = root.string();
    CardRecognizer rec(screen_, lib, matcher, sink_, &bus_, cfg);

    EXPECT_EQ(rec.loadSeasonTemplates(), 3);
    EXPECT_EQ(lib.get("alpha")->category, "card_s13_c2");
    EXPECT_EQ(lib.get("omega")->category, "card_s13_c5");
    EXPECT_EQ(lib.get("reroll")->category, "general");

    std::string from, to;
    int loaded = -1;
    auto sub = bus_.subscribe<SeasonChangedEvent>([&](const SeasonChangedEvent& e) {
        from = e.old_season;
        to = e.new_season;
        loaded = e.templates_loaded;
    });

    // unknown season: library cleared, only general templates remain
    EXPECT_EQ(rec.setSeason("s14"), 1);
    EXPECT_EQ(rec.season(), "s14");
    EXPECT_FALSE(lib.contains("alpha"));
    EXPECT_TRUE(lib.contains("reroll"));
    EXPECT_EQ(from, "s13");
    EXPECT_EQ(to, "s14");
    EXPECT_EQ(loaded, 1);
    EXPECT_EQ(rec.seasonCategory(3), "card_s14_c3");

    std::error_code ec;
    fs::remove_all(root, ec);
}
