#include "ModelFitter.hh"
#include "IrtErrors.hh"

#include <cstdio>
#include <iostream>
#include <sstream>

const char * FitStateName(FitState state)
{
    switch (state) {
        case FitState::ATTEMPTING_RICH: return "AttemptingRich";
        case FitState::RICH_ACCEPTED: return "RichAccepted";
        case FitState::RICH_REJECTED: return "RichRejected";
        case FitState::ATTEMPTING_SIMPLE: return "AttemptingSimple";
        case FitState::SIMPLE_ACCEPTED: return "SimpleAccepted";
    }
    return "Unknown";
}

ModelFitter::ModelFitter(ModelEstimationClient & estclient)
    : client(estclient), seed(12345), max_iter(10000), printlvl(0),
      min_discrim(0.01), max_discrim(10.0), max_abs_difficulty(10.0), max_guessing(0.5)
{
}

std::string ModelFitter::CheckPlausible(const std::vector<ItemCoefficients> & coef) const
{
    for (size_t i = 0; i < coef.size(); i++) {
        const ItemCoefficients & c = coef[i];
        std::stringstream msg;
        // Written so that NaN fails every check
        if (!(c.a > min_discrim && c.a <= max_discrim)) {
            msg << ItemId(int(i)) << " has discrimination " << c.a;
            return msg.str();
        }
        if (!(c.b >= -max_abs_difficulty && c.b <= max_abs_difficulty)) {
            msg << ItemId(int(i)) << " has difficulty " << c.b;
            return msg.str();
        }
        if (!(c.g >= 0.0 && c.g <= max_guessing)) {
            msg << ItemId(int(i)) << " has guessing " << c.g;
            return msg.str();
        }
    }
    return "";
}

FitResult ModelFitter::Fit(const Eigen::MatrixXd & responses) const
{
    FitResult result;
    std::shared_ptr<const FittedModel> model;
    FitState state = FitState::ATTEMPTING_RICH;

    while (true) {
        result.trace.push_back(state);

        switch (state) {

        case FitState::ATTEMPTING_RICH:
            if (printlvl > 0) printf("Attempting 3PL model fitting...\n");
            try {
                model = client.Fit(responses, ModelType::RICH_3PL, seed, max_iter);
            }
            catch (const std::exception & e) {
                std::cerr << "3PL model failed: " << e.what() << std::endl;
                model.reset();
            }

            if (!model) {
                result.rejection = "3PL estimation failed";
                state = FitState::RICH_REJECTED;
            }
            else if (!model->IsConverged()) {
                result.rejection = "3PL estimation did not converge";
                state = FitState::RICH_REJECTED;
            }
            else {
                result.rejection = CheckPlausible(model->GetCoefficients());
                state = result.rejection.empty() ? FitState::RICH_ACCEPTED : FitState::RICH_REJECTED;
            }
            break;

        case FitState::RICH_ACCEPTED:
            if (printlvl > 0) printf("3PL model fitted successfully with reasonable parameters\n");
            result.model = model;
            result.type = ModelType::RICH_3PL;
            return result;

        case FitState::RICH_REJECTED:
            if (printlvl > 0) printf("3PL rejected (%s), falling back to 2PL\n", result.rejection.c_str());
            state = FitState::ATTEMPTING_SIMPLE;
            break;

        case FitState::ATTEMPTING_SIMPLE:
            if (printlvl > 0) printf("Fitting 2PL model as fallback...\n");
            try {
                model = client.Fit(responses, ModelType::SIMPLE_2PL, seed, max_iter);
            }
            catch (const IrtError &) {
                throw;
            }
            catch (const std::exception & e) {
                throw EstimationError(std::string("2PL model failed: ") + e.what());
            }
            if (!model) throw EstimationError("2PL model failed: engine returned no model");
            state = FitState::SIMPLE_ACCEPTED;
            break;

        case FitState::SIMPLE_ACCEPTED:
            // Last resort: accepted even without convergence
            if (!model->IsConverged()) {
                std::cerr << "WARNING: 2PL model did not converge" << std::endl;
            }
            result.model = model;
            result.type = ModelType::SIMPLE_2PL;
            return result;
        }
    }
}
