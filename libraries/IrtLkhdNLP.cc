#include "IrtLkhdNLP.hh"
#include "IrtErrors.hh"

#include <cmath>

using namespace Ipopt;

IrtLkhdNLP::IrtLkhdNLP(const QuadratureModel & lkhdmodel, const std::vector<double> & xinit,
                       const std::vector<double> & xlo, const std::vector<double> & xup)
    : model(lkhdmodel), nfreeparam(lkhdmodel.GetNParam()),
      Xinit(xinit), XLo(xlo), XUp(xup), solved(false), finalobj(0.0)
{
    if (int(Xinit.size()) != nfreeparam || int(XLo.size()) != nfreeparam || int(XUp.size()) != nfreeparam) {
        throw EstimationError("Starting values and bounds do not match the number of parameters");
    }
}

IrtLkhdNLP::~IrtLkhdNLP()
{}

// returns the size of the problem
bool IrtLkhdNLP::get_nlp_info(Index& n, Index& m, Index& nnz_jac_g,
                              Index& nnz_h_lag, IndexStyleEnum& index_style)
{
    n = nfreeparam;

    // bounds only, no constraints
    m = 0;
    nnz_jac_g = 0;

    // limited-memory Hessian
    nnz_h_lag = 0;

    index_style = TNLP::C_STYLE;
    return true;
}

bool IrtLkhdNLP::get_bounds_info(Index n, Number* x_l, Number* x_u,
                                 Index m, Number* g_l, Number* g_u)
{
    if (n != nfreeparam || m != 0) return false;
    for (Index i = 0; i < n; i++) {
        x_l[i] = XLo[i];
        x_u[i] = XUp[i];
    }
    return true;
}

bool IrtLkhdNLP::get_starting_point(Index n, bool init_x, Number* x,
                                    bool init_z, Number* z_L, Number* z_U,
                                    Index m, bool init_lambda,
                                    Number* lambda)
{
    // only primal starting values are provided
    if (!init_x || init_z || init_lambda || n != nfreeparam) return false;
    for (Index i = 0; i < n; i++) x[i] = Xinit[i];
    return true;
}

bool IrtLkhdNLP::eval_f(Index n, const Number* x, bool new_x, Number& obj_value)
{
    if (n != nfreeparam) return false;

    std::vector<double> par(x, x + n);
    std::vector<double> grad;
    double loglkhd = 0.0;
    model.CalcLkhd(par, loglkhd, grad, 1);

    // Ipopt minimizes
    obj_value = -loglkhd;
    return std::isfinite(obj_value);
}

bool IrtLkhdNLP::eval_grad_f(Index n, const Number* x, bool new_x, Number* grad_f)
{
    if (n != nfreeparam) return false;

    std::vector<double> par(x, x + n);
    std::vector<double> grad;
    double loglkhd = 0.0;
    model.CalcLkhd(par, loglkhd, grad, 2);

    for (Index i = 0; i < n; i++) {
        grad_f[i] = -grad[i];
        if (!std::isfinite(grad_f[i])) return false;
    }
    return true;
}

bool IrtLkhdNLP::eval_g(Index n, const Number* x, bool new_x, Index m, Number* g)
{
    return m == 0;
}

bool IrtLkhdNLP::eval_jac_g(Index n, const Number* x, bool new_x,
                            Index m, Index nele_jac, Index* iRow, Index *jCol,
                            Number* values)
{
    return m == 0;
}

void IrtLkhdNLP::finalize_solution(SolverReturn status,
                                   Index n, const Number* x, const Number* z_L, const Number* z_U,
                                   Index m, const Number* g, const Number* lambda,
                                   Number obj_value,
                                   const IpoptData* ip_data,
                                   IpoptCalculatedQuantities* ip_cq)
{
    finalparam.assign(x, x + n);
    finalobj = obj_value;
    solved = true;
}
