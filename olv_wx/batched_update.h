// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef BATCHED_UPDATE_H_9910283746501928374
#define BATCHED_UPDATE_H_9910283746501928374

#include <wx/timer.h>
#include <olv/batched_update.h>
#include "object_list_view.h"


namespace olv
{
//ObjectListView<T> changes at most once per update period; a timer applies what is pending
template <class T>
class BatchedObjectListView
{
public:
    using ObjectPtr = std::shared_ptr<T>;

    BatchedObjectListView(ObjectListView<T>& olv, std::chrono::milliseconds updatePeriod = std::chrono::milliseconds(250)) :
        batch_(makeBatchTarget<T>(olv), updatePeriod)
    {
        timer_.Bind(wxEVT_TIMER, [this](wxTimerEvent& event)
        {
            batch_.tick();
            if (!batch_.hasPendingUpdate())
                timer_.Stop();
        });
    }

    void setObjects    (const std::vector<ObjectPtr>& objects) { batch_.setObjects    (objects); startTimer(); }
    void addObjects    (const std::vector<ObjectPtr>& objects) { batch_.addObjects    (objects); startTimer(); }
    void removeObjects (const std::vector<const T*>&  objects) { batch_.removeObjects (objects); startTimer(); }
    void refreshObjects(const std::vector<const T*>&  objects) { batch_.refreshObjects(objects); startTimer(); }

    void flush() { timer_.Stop(); batch_.flush(); }
    bool hasPendingUpdate() const { return batch_.hasPendingUpdate(); }

    void setUpdatePeriod(std::chrono::milliseconds updatePeriod) { batch_.setUpdatePeriod(updatePeriod); }

private:
    BatchedObjectListView           (const BatchedObjectListView&) = delete;
    BatchedObjectListView& operator=(const BatchedObjectListView&) = delete;

    void startTimer()
    {
        if (batch_.hasPendingUpdate() && !timer_.IsRunning())
            timer_.Start(static_cast<int>(batch_.getUpdatePeriod().count()));
    }

    BatchedUpdate<T> batch_;
    wxTimer timer_;
};
}

#endif //BATCHED_UPDATE_H_9910283746501928374
