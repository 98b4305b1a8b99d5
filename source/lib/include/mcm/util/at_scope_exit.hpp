#pragma once

#include <utility>

// Runs a cleanup when leaving the scope unless it was dismissed before
template<class FunT>
class AtScopeExit
{
  public:
    AtScopeExit(FunT fun)
        : m_Cleanup{ std::move(fun) }
    {
    }

    AtScopeExit(const AtScopeExit&) = delete;
    AtScopeExit& operator=(const AtScopeExit&) = delete;

    ~AtScopeExit()
    {
        if (m_Armed)
        {
            m_Cleanup();
        }
    }

    void Dismiss()
    {
        m_Armed = false;
    }

  private:
    FunT m_Cleanup;
    bool m_Armed{ true };
};
