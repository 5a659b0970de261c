#include "pose_presenter.h"

#include <nlohmann/json.hpp>

#include <utility>

namespace App
{
    using json = nlohmann::json;

    void PosePresenter::present(const Dice::TrajectoryFrame &poses)
    {
        _last = poses;
        ++_count;
    }

    std::string PosePresenter::capture_frame()
    {
        return encode(_last, _count);
    }

    std::string PosePresenter::encode(const Dice::TrajectoryFrame &poses, uint64_t frame_number)
    {
        json root;
        root["frame"] = frame_number;
        root["dice"] = json::array();
        for (const Dice::DiePose &pose : poses)
        {
            const glm::vec3 &p = pose.position;
            const glm::quat &q = pose.orientation;
            json die;
            die["position"] = {p.x, p.y, p.z};
            die["orientation"] = {q.w, q.x, q.y, q.z};
            root["dice"].push_back(std::move(die));
        }
        return root.dump();
    }
} // namespace App
