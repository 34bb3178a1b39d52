#include "../playback/SpeechThread.h"
#include "TestHelpers.h"
#include <stdexcept>

using namespace Phonoclip;
using namespace Phonoclip::TestHelpers;

class PlaybackTests : public juce::UnitTest
{
public:
    PlaybackTests() : UnitTest ("Playback", "Phonoclip") {}

    void runTest() override
    {
        beginTest ("Scoped stream always releases the sink");
        {
            RecordingSink sink;
            {
                ScopedPlaybackStream stream (sink, PcmFormat::target());
                expect (stream.isOpen());
                const juce::int16 silence[4] = {};
                expect (stream.write (silence, sizeof (silence)));
            }
            expectEquals (sink.record->stops.load(), 1);
            expectEquals (sink.record->closes.load(), 1);

            RecordingSink failing;
            failing.failOpen = true;
            {
                ScopedPlaybackStream stream (failing, PcmFormat::target());
                expect (! stream.isOpen());
                expectEquals (stream.getError(), juce::String ("device busy"));
                expect (! stream.write ("x", 1));
            }
            expectEquals (failing.record->writes.load(), 0);
            expectEquals (failing.record->closes.load(), 1);

            RecordingSink throwing;
            try
            {
                ScopedPlaybackStream stream (throwing, PcmFormat::target());
                throw std::runtime_error ("render failed");
            }
            catch (const std::runtime_error&)
            {
            }
            expectEquals (throwing.record->stops.load(), 1);
            expectEquals (throwing.record->closes.load(), 1);
        }

        beginTest ("Speech thread serves requests in order");
        {
            TestVoiceBank bank;
            bank.addWord ("ONE", 1000, 1);
            bank.addWord ("TWO", 2000, 2);
            FakePhonemizer g2p;
            FirstVariantSelector selector;
            Renderer renderer (g2p, selector);

            auto record = std::make_shared<SinkRecord>();
            std::atomic<int> created { 0 };

            juce::CriticalSection lock;
            juce::StringArray finished;
            std::vector<RenderResult::Status> statuses;
            juce::WaitableEvent allDone;

            // The first sink refuses to open; later ones work.
            SpeechThread speech (renderer, bank.root, SynthConfig::forLivePlayback(), [record, &created]
            {
                auto sink = std::make_unique<RecordingSink> (record);
                sink->failOpen = (created++ == 0);
                return std::unique_ptr<PlaybackSink> (std::move (sink));
            });

            speech.setOnFinished ([&] (const juce::String& text, const RenderResult& result)
            {
                const juce::ScopedLock sl (lock);
                finished.add (text);
                statuses.push_back (result.status);
                if (finished.size() == 3)
                    allDone.signal();
            });

            speech.speak ("one");
            speech.speak ("two");
            speech.speak ("   ");
            speech.speak ("nothing here");
            expectEquals (speech.getNumPending(), 3);

            speech.startThread();
            expect (allDone.wait (10000));

            const juce::ScopedLock sl (lock);
            expectEquals (finished.joinIntoString ("|"), juce::String ("one|two|nothing here"));
            expect (statuses[0] == RenderResult::Status::DeviceUnavailable);
            expect (statuses[1] == RenderResult::Status::Rendered);
            expect (statuses[2] == RenderResult::Status::NothingToRender);
            expectEquals (record->opens.load(), 2);
            expectEquals (record->closes.load(), 2);
            expectEquals ((int) record->bytes.load(), (2000 + 441) * 2);
        }

        beginTest ("Cancelling the current request");
        {
            TestVoiceBank bank;
            bank.addWord ("LONG", 44100, 3);
            FakePhonemizer g2p;
            FirstVariantSelector selector;
            Renderer renderer (g2p, selector);

            auto record = std::make_shared<SinkRecord>();
            SpeechThread* speechPtr = nullptr;
            RenderResult::Status status = RenderResult::Status::Rendered;
            juce::WaitableEvent done;

            SpeechThread speech (renderer, bank.root, SynthConfig::forLivePlayback(), [record, &speechPtr]
            {
                auto sink = std::make_unique<RecordingSink> (record);
                sink->onWrite = [&speechPtr] { speechPtr->cancelCurrent(); };
                return std::unique_ptr<PlaybackSink> (std::move (sink));
            });
            speechPtr = &speech;

            speech.setOnFinished ([&] (const juce::String&, const RenderResult& result)
            {
                status = result.status;
                done.signal();
            });

            speech.startThread();
            speech.speak ("long");
            expect (done.wait (10000));
            expect (status == RenderResult::Status::Cancelled);
            expectEquals (record->writes.load(), 1);
            expectEquals (record->closes.load(), 1);
        }

        beginTest ("Missing sink factory");
        {
            TestVoiceBank bank;
            bank.addWord ("HI", 100, 3);
            FakePhonemizer g2p;
            FirstVariantSelector selector;
            Renderer renderer (g2p, selector);

            RenderResult::Status status = RenderResult::Status::Rendered;
            juce::WaitableEvent done;
            SpeechThread speech (renderer, bank.root, SynthConfig::forLivePlayback(), nullptr);

            speech.setOnFinished ([&] (const juce::String&, const RenderResult& result)
            {
                status = result.status;
                done.signal();
            });

            speech.startThread();
            speech.speak ("hi");
            expect (done.wait (10000));
            expect (status == RenderResult::Status::DeviceUnavailable);
        }
    }
};

static PlaybackTests playbackTests;
