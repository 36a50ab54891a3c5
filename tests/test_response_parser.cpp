#include <catch2/catch_test_macros.hpp>

#include "analysis/prompt_builder.hpp"
#include "analysis/response_parser.hpp"

#include <ctime>
#include <string>

namespace {

Clock::time_point local_time_at(int hour) {
    std::time_t now = Clock::to_time_t(Clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    tm.tm_hour = hour;
    tm.tm_min = 30;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    return Clock::from_time_t(std::mktime(&tm));
}

} // namespace

TEST_CASE("Completion parsing", "[analysis]") {
    auto request = AnalysisRequest::make("我今天花了25元买午餐");

    SECTION("FlatObject") {
        auto r = parse_completion(
            R"({"amount": 25, "category": "餐饮", "title": "午餐", "description": "工作日午饭",
                "confidence": 0.92, "tags": ["午餐", "工作日"]})",
            request);
        REQUIRE(r);
        REQUIRE(r->extracted_amount->to_string(2) == "25.00");
        REQUIRE(r->category == ExpenseCategory::Food);
        REQUIRE(r->title == "午餐");
        REQUIRE(r->description == "工作日午饭");
        REQUIRE(r->confidence == 0.92);
        REQUIRE(r->tags == std::vector<std::string>{"午餐", "工作日"});
        REQUIRE(r->original_text == "我今天花了25元买午餐");
        REQUIRE(r->is_valid());
    }

    SECTION("FencedAndSurroundedByProse") {
        auto fenced = parse_completion("```json\n{\"amount\": \"18.5\", \"title\": \"咖啡\"}\n```", request);
        REQUIRE(fenced);
        REQUIRE(fenced->extracted_amount->to_string() == "18.5");

        auto prose = parse_completion("好的，结果如下：{\"amount\": 7, \"title\": \"地铁\", \"category\": \"交通\"} 希望有帮助", request);
        REQUIRE(prose);
        REQUIRE(prose->category == ExpenseCategory::Transport);
    }

    SECTION("ExpensesArraySplitsIntoPrimaryAndAlternatives") {
        auto r = parse_completion(R"({
            "expenses": [
                {"amount": 25, "category": "餐饮", "title": "午餐"},
                {"amount": 15, "category": "交通", "title": "打车", "confidence": 0.7},
                {"category": "购物", "title": "没有金额"}
            ],
            "confidence": 0.9,
            "tags": ["日常"]
        })", request);
        REQUIRE(r);
        REQUIRE(r->title == "午餐");
        REQUIRE(r->confidence == 0.9);
        REQUIRE(r->tags == std::vector<std::string>{"日常"});
        REQUIRE(r->alternatives.size() == 2);
        REQUIRE(r->alternatives[0].amount->to_string() == "15");
        REQUIRE(r->alternatives[0].category == ExpenseCategory::Transport);
        REQUIRE(r->alternatives[0].confidence == 0.7);
        REQUIRE_FALSE(r->alternatives[1].amount);
        REQUIRE(r->alternatives[1].confidence == 0.9);
    }

    SECTION("DefaultsAndClamping") {
        auto r = parse_completion(R"({"amount": 3, "title": "水", "category": "饮料", "confidence": 1.7})", request);
        REQUIRE(r);
        REQUIRE(r->category == ExpenseCategory::Other);
        REQUIRE(r->confidence == 1.0);

        auto d = parse_completion(R"({"amount": 3, "title": "水"})", request);
        REQUIRE(d->confidence == kDefaultConfidence);
    }

    SECTION("FloatAmountsStayExact") {
        auto r = parse_completion(R"({"amount": 12.34, "title": "面包"})", request);
        REQUIRE(r);
        REQUIRE(r->extracted_amount->to_string() == "12.34");
    }

    SECTION("ExtremeAndExponentAmounts") {
        REQUIRE_FALSE(parse_completion(R"({"amount": 18446744073709551615, "title": "t"})", request));
        REQUIRE_FALSE(parse_completion(R"({"amount": 9223372036854775808, "title": "t"})", request));

        auto big = parse_completion(R"({"amount": 9223372036854775807, "title": "t"})", request);
        REQUIRE(big);
        REQUIRE_FALSE(big->extracted_amount->is_negative());

        auto exp = parse_completion(R"({"amount": "1e2", "title": "t"})", request);
        REQUIRE(exp);
        REQUIRE(exp->extracted_amount->to_string(2) == "100.00");
    }

    SECTION("TagsDeduplicatedInOrder") {
        auto r = parse_completion(R"({"amount": 1, "title": "t", "tags": ["a", " a ", "b", 3, ""]})", request);
        REQUIRE(r->tags == std::vector<std::string>{"a", "b"});
    }

    SECTION("UnusableContent") {
        REQUIRE_FALSE(parse_completion("", request));
        REQUIRE_FALSE(parse_completion("我无法理解这段话", request));
        REQUIRE_FALSE(parse_completion("[1, 2, 3]", request));
        REQUIRE_FALSE(parse_completion(R"({"title": "午餐"})", request));
        REQUIRE_FALSE(parse_completion(R"({"amount": "很多", "title": "午餐"})", request));
        REQUIRE_FALSE(parse_completion(R"({"expenses": []})", request));
    }

    SECTION("StripCodeFence") {
        REQUIRE(strip_code_fence("```\n{}\n```") == "{}");
        REQUIRE(strip_code_fence("  {\"a\":1}  ") == "{\"a\":1}");
        REQUIRE(strip_code_fence("```") == "");
    }
}

TEST_CASE("Fallback result", "[analysis]") {
    auto request = AnalysisRequest::make("嗯那个");

    SECTION("MorningSuggestsBreakfast") {
        request.timestamp = local_time_at(8);
        auto r = fallback_result(request);
        REQUIRE(r.title == "早餐");
        REQUIRE_FALSE(r.extracted_amount);
        REQUIRE(r.confidence == kFallbackConfidence);
        REQUIRE(r.category == ExpenseCategory::Other);
        REQUIRE(r.original_text == "嗯那个");
    }

    SECTION("EveningSuggestsDinner") {
        request.timestamp = local_time_at(18);
        REQUIRE(fallback_result(request).title == "晚餐");
    }

    SECTION("OtherwiseAsksForManualEntry") {
        request.timestamp = local_time_at(14);
        auto r = fallback_result(request);
        REQUIRE(r.title == "待补充支出");
        REQUIRE(r.description == "无法解析语音内容，请手动输入");
    }

    SECTION("NeverValid") {
        REQUIRE_FALSE(fallback_result(request).is_valid());
    }
}

TEST_CASE("Analysis prompt", "[analysis]") {

    SECTION("ContainsTranscriptAndVocabulary") {
        auto prompt = build_analysis_prompt(AnalysisRequest::make("打车花了30"));
        REQUIRE(prompt.find("打车花了30") != std::string::npos);
        REQUIRE(prompt.find(category_vocabulary("、")) != std::string::npos);
        REQUIRE(prompt.find("expenses") != std::string::npos);
    }

    SECTION("PreferencesIncludedWhenSet") {
        UserPreferences prefs;
        prefs.preferred_categories = {ExpenseCategory::Transport};
        prefs.common_merchants = {"滴滴"};
        auto prompt = build_analysis_prompt(AnalysisRequest::make("打车花了30", prefs));
        REQUIRE(prompt.find("滴滴") != std::string::npos);
        REQUIRE(prompt.find("常用分类：交通") != std::string::npos);
    }

    SECTION("EmptyPreferencesAddNothing") {
        UserPreferences prefs;
        prefs.default_currency.clear();
        REQUIRE(build_preferences_context(prefs).empty());
    }
}
