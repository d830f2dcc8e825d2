#ifndef IRTLKHDNLP_HH
#define IRTLKHDNLP_HH

#include "QuadratureModel.hh"

#include <vector>
#include "IpTNLP.hpp"

// Ipopt problem: minimize the negative marginal log-likelihood of a
// QuadratureModel subject to box bounds on the item parameters.
// The Hessian is left to Ipopt's limited-memory approximation.
class IrtLkhdNLP : public Ipopt::TNLP {
private:
    const QuadratureModel & model;
    int nfreeparam;
    std::vector<double> Xinit;
    std::vector<double> XLo;
    std::vector<double> XUp;

    bool solved;
    std::vector<double> finalparam;
    double finalobj;

    IrtLkhdNLP(const IrtLkhdNLP &);
    IrtLkhdNLP & operator=(const IrtLkhdNLP &);

public:
    IrtLkhdNLP(const QuadratureModel & lkhdmodel, const std::vector<double> & xinit,
               const std::vector<double> & xlo, const std::vector<double> & xup);
    virtual ~IrtLkhdNLP();

    bool HasSolution() const { return solved; }
    const std::vector<double> & GetFinalParam() const { return finalparam; }
    double GetFinalObjective() const { return finalobj; }

    virtual bool get_nlp_info(Ipopt::Index & n, Ipopt::Index & m, Ipopt::Index & nnz_jac_g,
                              Ipopt::Index & nnz_h_lag, IndexStyleEnum & index_style);

    virtual bool get_bounds_info(Ipopt::Index n, Ipopt::Number * x_l, Ipopt::Number * x_u,
                                 Ipopt::Index m, Ipopt::Number * g_l, Ipopt::Number * g_u);

    virtual bool get_starting_point(Ipopt::Index n, bool init_x, Ipopt::Number * x,
                                    bool init_z, Ipopt::Number * z_L, Ipopt::Number * z_U,
                                    Ipopt::Index m, bool init_lambda, Ipopt::Number * lambda);

    virtual bool eval_f(Ipopt::Index n, const Ipopt::Number * x, bool new_x, Ipopt::Number & obj_value);

    virtual bool eval_grad_f(Ipopt::Index n, const Ipopt::Number * x, bool new_x, Ipopt::Number * grad_f);

    virtual bool eval_g(Ipopt::Index n, const Ipopt::Number * x, bool new_x, Ipopt::Index m, Ipopt::Number * g);

    virtual bool eval_jac_g(Ipopt::Index n, const Ipopt::Number * x, bool new_x,
                            Ipopt::Index m, Ipopt::Index nele_jac, Ipopt::Index * iRow,
                            Ipopt::Index * jCol, Ipopt::Number * values);

    virtual void finalize_solution(Ipopt::SolverReturn status,
                                   Ipopt::Index n, const Ipopt::Number * x,
                                   const Ipopt::Number * z_L, const Ipopt::Number * z_U,
                                   Ipopt::Index m, const Ipopt::Number * g, const Ipopt::Number * lambda,
                                   Ipopt::Number obj_value,
                                   const Ipopt::IpoptData * ip_data,
                                   Ipopt::IpoptCalculatedQuantities * ip_cq);
};

#endif // IRTLKHDNLP_HH
