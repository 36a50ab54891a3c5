#include "analysis/prompt_builder.hpp"

#include <format>

namespace {

std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

} // namespace

std::string build_analysis_prompt(const AnalysisRequest& request) {
    auto vocabulary = category_vocabulary("、");

    auto prompt = std::format(R"(你是一个专业的费用记录分析助手。请分析以下语音转文本的内容，提取费用信息并分类。

语音内容："{}"

请按照以下 JSON 格式返回分析结果：
{{
    "expenses": [
        {{
            "amount": 金额数字（仅数字，不含货币符号）,
            "category": "分类（从以下选项中选择：{}）",
            "title": "简短的费用标题",
            "description": "详细描述"
        }}
    ],
    "confidence": 置信度（0-1之间的小数）,
    "tags": ["相关标签数组"]
}}

分析要求：
1. 准确识别金额，支持各种表达方式（如"五十块"、"50元"、"半百"等）
2. 根据语境智能推断费用类别，分类必须完全匹配给定选项
3. 生成简洁明了的标题
4. 提供详细的描述信息
5. 给出分析的置信度评估
6. 如果一句话里包含多笔费用，每笔费用单独作为 expenses 中的一项

请仅返回 JSON 格式的结果，不要包含其他文字。)",
                              request.voice_text, vocabulary);

    if (!request.context.empty()) {
        prompt += std::format("\n\n补充上下文：{}\n", request.context);
    }
    if (request.preferences) {
        prompt += build_preferences_context(*request.preferences);
    }
    return prompt;
}

std::string build_preferences_context(const UserPreferences& prefs) {
    if (prefs.preferred_categories.empty() && prefs.common_merchants.empty() &&
        prefs.default_currency.empty()) {
        return {};
    }

    std::string context = "\n\n用户偏好信息：\n";

    if (!prefs.preferred_categories.empty()) {
        std::vector<std::string> labels;
        for (auto c : prefs.preferred_categories) labels.emplace_back(category_label(c));
        context += std::format("常用分类：{}\n", join(labels, "、"));
    }
    if (!prefs.common_merchants.empty()) {
        context += std::format("常去商家：{}\n", join(prefs.common_merchants, "、"));
    }
    if (!prefs.default_currency.empty()) {
        context += std::format("默认货币：{}\n", prefs.default_currency);
    }
    return context;
}
