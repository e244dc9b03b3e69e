/**
 * This file is a part of qtermdoc Project.
 * qtermdoc renders document pages inside a terminal
 * Copyright 2021-2022 Britanicus <marcusbritanicus@gmail.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * at your option, any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 **/

#pragma once

#include <QtCore>
#include <QtGui/QImage>

#include <qtermdoc/QTermDocument.hpp>
#include <qtermdoc/QTermPageCache.hpp>
#include <qtermdoc/QTermSink.hpp>
#include <qtermdoc/QTermTextEngine.hpp>
#include <qtermdoc/QTermViewerOptions.hpp>
#include <qtermdoc/QTermViewport.hpp>

/* Where the time of one image frame went, in milliseconds; -1 if not measured */
struct QTermFrameTimings {
    qint64 rasterizeMs = -1;
    qint64 viewportMs  = -1;
    qint64 downscaleMs = -1;
    qint64 protocolMs  = -1;
};

/**
 * Drives a viewing session: owns the page index, decides when a
 * frame must be produced, sends rasterization and text structuring off
 * the interactive thread and hands the results to the sink.
 *
 * A frame is produced only when the current state differs from the one
 * last committed, or a reason was forced (result arrived, reload, reset).
 */
class QTermRenderer : public QObject {
    Q_OBJECT;

    public:
        enum DirtyReason {
            NotDirty        = 0x00,
            PageChanged     = 0x01,
            ModeChanged     = 0x02,
            ViewportChanged = 0x04,
            FrameResized    = 0x08,
            DocumentChanged = 0x10,
            ResultArrived   = 0x20,
            ForcedRedraw    = 0x40
        };
        Q_DECLARE_FLAGS( DirtyReasons, DirtyReason );

        QTermRenderer( QTermViewerOptions opts, QObject *parent = nullptr );
        ~QTermRenderer();

        /* @doc is not owned; it must outlive us or be replaced first */
        void setDocument( QTermDocument *doc );
        QTermDocument *document() const;

        /* @sink is not owned */
        void setSink( QTermSink *sink );
        QTermSink *sink() const;

        QTermViewerOptions options() const;

        QTermPageCache *cache() const;
        QTermTextEngine *textEngine() const;

        /* Zero-based; 0 when no document is ready */
        int currentPage() const;
        int pageCount() const;

        bool canGoToPreviousPage() const;
        bool canGoToNextPage() const;

        QTermViewerOptions::ViewMode viewMode() const;
        QTermTextEngine::TextMode textMode() const;

        QTermViewportState viewport() const;
        QSize cellSize() const;

        int textScroll() const;

        /* Number of lines of the current page in the current text layout */
        int textLineCount() const;

        bool isDirty() const;
        DirtyReasons dirtyReasons() const;

        /* Does the current page fail to rasterize? */
        bool isPageFailed() const;

        QTermFrameTimings lastTimings() const;

        /* Results that arrived for a state we had already left */
        int droppedResults() const;

        /* Frames actually produced */
        int framesProduced() const;

    public Q_SLOTS:
        /* Out-of-range pages are ignored */
        void setPage( int page );
        void nextPage();
        void previousPage();
        void firstPage();
        void lastPage();

        void zoomIn();
        void zoomOut();
        void setZoom( int percent );

        /* Back to 100%, no pan; always produces a frame */
        void resetView();

        /* Pan the image by whole cells */
        void panBy( int dCols, int dRows );

        /* Frame height minus two rows, as a pan or a text scroll */
        void pageDown();
        void pageUp();

        void setViewMode( QTermViewerOptions::ViewMode mode );
        void toggleViewMode();

        void setTextMode( QTermTextEngine::TextMode mode );
        void cycleTextMode();

        void scrollText( int lines );

        void setFrameSize( int cols, int rows );
        void setCellSize( QSize cellPx );

        void markDirty( QTermRenderer::DirtyReason reason = ForcedRedraw );

        /**
         * Produce a frame if anything changed. Returns true when output was
         * written; false when the state is clean or work was handed to a
         * worker (frameReady() follows).
         */
        bool renderFrame();

    private Q_SLOTS:
        void handleImage( QTermCacheKey key, QImage image, qint64 elapsedMs );
        void handleText( int page, quint64 generation );

        void handleDocumentStatus( QTermDocument::Status status );
        void handleDocumentReloading();
        void handleDocumentReloaded();

    private:
        /* Everything a frame depends on */
        struct Snapshot {
            int page = -1;
            QTermViewerOptions::ViewMode viewMode = QTermViewerOptions::ImageView;
            QTermTextEngine::TextMode textMode    = QTermTextEngine::Reflow;
            QTermViewportState viewport;
            QSize cellSize;
            int textScroll     = 0;
            quint64 generation = 0;

            bool operator==( const Snapshot& other ) const;
            bool operator!=( const Snapshot& other ) const;
        };

        /* Page count from the document; the current page is kept when it still exists */
        void syncPages();

        /* Pan, scroll and failed-page bookkeeping of a page change */
        void pageChanged( int page );

        Snapshot current() const;
        void commit();

        /* Request key of the current image frame */
        QTermCacheKey currentKey() const;

        bool renderImage();
        bool renderText();
        bool renderFailure();

        /* Text of the current page if we have it; dispatches a task otherwise */
        bool currentText( QTermTextPage& page );

        void dispatchRender( const QTermCacheKey& key );
        void dispatchText( int page );

        /* Cropped and downscaled view of @bitmap for @placement */
        QImage transmitBuffer( const QTermCachedBitmap& bitmap, const QTermPlacement& placement );

        QTermRenderOptions renderOptions() const;

        QTermViewerOptions mOpts;

        QPointer<QTermDocument> mDoc;
        QTermSink *mSink;

        int mPage;
        int mPageCount;

        QTermPageCache *mCache;
        QTermTextEngine *mText;

        QThreadPool *mPool;

        QTermViewerOptions::ViewMode mViewMode;
        QTermTextEngine::TextMode mTextMode;
        QTermViewportState mViewport;
        QSize mCellSize;
        int mTextScroll;
        int mTextLines;

        /* Text or a placeholder is on screen, to be erased before an image */
        bool mTextOnScreen;

        Snapshot mCommitted;
        bool mHasCommitted;
        DirtyReasons mForced;

        QSet<QTermCacheKey> mRendering;
        QSet<int> mStructuring;
        QSet<QTermCacheKey> mFailed;

        /* Last result delivered by a worker, kept until the next frame uses it */
        QTermCachedBitmap mDelivered;
        qint64 mDeliveredMs;

        /* Last buffer handed to the sink and what it was made from */
        QImage mSent;
        qint64 mSentSource;
        QTermPlacement mSentPlacement;

        QTermFrameTimings mTimings;
        int mDropped;
        int mFrames;

    Q_SIGNALS:
        void currentPageChanged( int page );
        void pageCountChanged( int count );

        /* A worker finished something the current state is waiting for */
        void frameReady();

        void frameRendered( int page );
        void pageFailed( int page );
        void documentFailed( QTermDocument::Error error );

        /* Page, mode, zoom or scroll changed: status lines listen to this */
        void stateChanged();
};

Q_DECLARE_OPERATORS_FOR_FLAGS( QTermRenderer::DirtyReasons );
