#include "ContactResolver.h"

ContactResolver::ContactResolver(const KindTable &kinds, double contactRadius)
    : kinds_(kinds), contactRadius_(contactRadius)
{
}

bool ContactResolver::resolve(std::vector<Agent> &agents) const
{
    const double r2 = contactRadius_ * contactRadius_;
    const size_t n = agents.size();
    bool converted = false;

    for (size_t i = 0; i < n; ++i)
    {
        for (size_t j = i + 1; j < n; ++j)
        {
            Agent &a = agents[i];
            Agent &b = agents[j];
            if (a.kind == b.kind || distanceSquared(a.position, b.position) > r2)
                continue;

            // kinds that are not adjacent in the cycle pass through each other
            if (kinds_.beats(a.kind) == b.kind)
            {
                b.kind = a.kind;
                converted = true;
                if (onConverted)
                    onConverted(j, b.kind);
            }
            else if (kinds_.beats(b.kind) == a.kind)
            {
                a.kind = b.kind;
                converted = true;
                if (onConverted)
                    onConverted(i, a.kind);
            }
        }
    }
    return converted;
}
