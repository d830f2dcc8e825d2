#include "ParameterExtractor.hh"

#include <cmath>
#include <cstdio>
#include <iostream>

namespace {

// Standard errors: 0 when unavailable or not a finite number
double SEOrZero(double se)
{
    return std::isfinite(se) ? RoundTo(se, 4) : 0.0;
}

} // namespace

std::vector<ItemParameter> ParameterExtractor::Extract(const std::vector<ItemCoefficients> & coefficients,
                                                       const std::vector<ItemCoefficients> & standard_errors,
                                                       ModelType type) const
{
    std::vector<ItemParameter> params(coefficients.size());

    for (size_t i = 0; i < coefficients.size(); i++) {
        const ItemCoefficients & c = coefficients[i];
        ItemParameter & p = params[i];

        p.item_id = ItemId(int(i));
        p.model_type = type;
        p.discrimination = IsMissing(c.a) ? 1.0 : RoundTo(c.a, 4);
        p.difficulty = IsMissing(c.b) ? 0.0 : RoundTo(c.b, 4);
        if (type == ModelType::RICH_3PL && !IsMissing(c.g)) p.guessing = RoundTo(c.g, 4);
        else p.guessing = 0.0;

        p.se_discrimination = 0.0;
        p.se_difficulty = 0.0;
        p.se_guessing = 0.0;
        if (i < standard_errors.size()) {
            const ItemCoefficients & se = standard_errors[i];
            p.se_discrimination = SEOrZero(se.a);
            p.se_difficulty = SEOrZero(se.b);
            if (type == ModelType::RICH_3PL) p.se_guessing = SEOrZero(se.g);
        }
    }
    return params;
}

void ParameterExtractor::Clean(std::vector<ItemParameter> & params, ModelType type) const
{
    for (size_t i = 0; i < params.size(); i++) {
        ItemParameter & p = params[i];

        if (p.discrimination < 0.0) {
            if (printlvl > 0) printf("Fixed negative discrimination for item %d from %g to %g\n",
                                     int(i) + 1, p.discrimination, std::fabs(p.discrimination));
            p.discrimination = std::fabs(p.discrimination);
        }
        if (p.discrimination > 4.0) {
            if (printlvl > 0) printf("Capped discrimination for item %d from %g to 4.0\n", int(i) + 1, p.discrimination);
            p.discrimination = 4.0;
        }
        if (p.discrimination < 0.1) p.discrimination = 0.1;

        if (p.difficulty < -4.0) p.difficulty = -4.0;
        if (p.difficulty > 4.0) p.difficulty = 4.0;

        if (type == ModelType::RICH_3PL) {
            if (p.guessing < 0.0) p.guessing = 0.0;
            if (p.guessing > 0.5) p.guessing = 0.5;
        }
    }
}

std::vector<ItemParameter> ParameterExtractor::ExtractFromModel(const FittedModel & model, ModelType type) const
{
    std::vector<ItemCoefficients> coef = model.GetCoefficients();
    std::vector<ItemCoefficients> se;
    try {
        se = model.GetStandardErrors();
        if (printlvl > 0) printf("Successfully extracted standard errors\n");
    }
    catch (const std::exception & e) {
        std::cerr << "WARNING: Standard errors not available: " << e.what() << std::endl;
        se.assign(coef.size(), ItemCoefficients(0.0, 0.0, 0.0));
    }

    std::vector<ItemParameter> params = Extract(coef, se, type);
    Clean(params, type);
    return params;
}
