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

#include <qtermdoc/QTermRenderer.hpp>

#include "RendererImpl.hpp"

/*
 * RenderTask
 */
RenderTask::RenderTask( QTermDocument *doc, QTermPageCache *cache, QTermCacheKey key, QTermRenderOptions opts ) : QObject(), QRunnable() {
    mDoc   = doc;
    mCache = cache;
    mKey   = key;
    mOpts  = opts;
}


QTermCacheKey RenderTask::key() const {
    return mKey;
}


void RenderTask::run() {
    QElapsedTimer timer;

    timer.start();

    QTermCachedBitmap bmp = render( mDoc, mCache, mKey, mOpts );

    emit imageReady( mKey, bmp.pixels, timer.elapsed() );
}


QTermCachedBitmap RenderTask::render( QTermDocument *doc, QTermPageCache *cache, QTermCacheKey key, QTermRenderOptions opts ) {
    opts.setColorMode( key.request.colorMode );

    return cache->getOrInsert(
        key, [ doc, key, opts ] () {
            return doc->renderPage( key.request.page, QSize( key.request.width, key.request.height ), opts );
        }
    );
}


/*
 * TextTask
 */
TextTask::TextTask( QTermTextEngine *engine, int page, quint64 generation ) : QObject(), QRunnable() {
    mEngine     = engine;
    mPage       = page;
    mGeneration = generation;
}


void TextTask::run() {
    mEngine->textPage( mPage );

    emit textReady( mPage, mGeneration );
}


/*
 * QTermRenderer
 */
bool QTermRenderer::Snapshot::operator==( const Snapshot& other ) const {
    return page == other.page and viewMode == other.viewMode and textMode == other.textMode and viewport == other.viewport and
           cellSize == other.cellSize and textScroll == other.textScroll and generation == other.generation;
}


bool QTermRenderer::Snapshot::operator!=( const Snapshot& other ) const {
    return not operator==( other );
}


QTermRenderer::QTermRenderer( QTermViewerOptions opts, QObject *parent ) : QObject( parent ) {
    qRegisterMetaType<QTermCacheKey>( "QTermCacheKey" );

    mOpts = opts;
    mOpts.normalize();

    mSink = nullptr;

    mPage      = 0;
    mPageCount = 0;

    mCache = new QTermPageCache( mOpts.cacheCapacity );
    mText  = new QTermTextEngine( mOpts.text );

    mPool = new QThreadPool( this );
    mPool->setMaxThreadCount( mOpts.workerThreads );

    mViewMode             = mOpts.viewMode;
    mTextMode             = mOpts.textMode;
    mViewport.zoomPercent = mOpts.zoomPercent;
    mCellSize             = QSize( 8, 16 );
    mTextScroll           = 0;
    mTextLines            = 0;
    mTextOnScreen         = false;

    mHasCommitted = false;
    mForced       = NotDirty;

    mDeliveredMs = -1;
    mSentSource  = 0;
    mDropped     = 0;
    mFrames      = 0;
}


QTermRenderer::~QTermRenderer() {
    /** Workers use the cache, the text engine and the document */
    mPool->waitForDone();

    delete mCache;
    delete mText;
}


void QTermRenderer::setDocument( QTermDocument *doc ) {
    if ( mDoc == doc ) {
        return;
    }

    mPool->waitForDone();

    /** Results for the old document may still be queued */
    QCoreApplication::removePostedEvents( this, QEvent::MetaCall );

    if ( mDoc ) {
        disconnect( mDoc.data(), nullptr, this, nullptr );
    }

    mDoc = doc;

    mCache->clear();
    mText->setDocument( doc );

    mRendering.clear();
    mStructuring.clear();
    mFailed.clear();

    mDelivered  = QTermCachedBitmap();
    mSent       = QImage();
    mSentSource = 0;

    if ( mDoc ) {
        connect( mDoc.data(), &QTermDocument::statusChanged, this, &QTermRenderer::handleDocumentStatus );

        /** Must run before the pages go away */
        connect( mDoc.data(), &QTermDocument::documentReloading, this, &QTermRenderer::handleDocumentReloading, Qt::DirectConnection );
        connect( mDoc.data(), &QTermDocument::documentReloaded, this, &QTermRenderer::handleDocumentReloaded );
    }

    /** A new document starts at its first page */
    mPage = 0;
    syncPages();
    pageChanged( mPage );
    emit currentPageChanged( mPage );

    markDirty( DocumentChanged );

    if ( mDoc and (mDoc->status() == QTermDocument::Failed) ) {
        qCritical() << "Unable to open" << mDoc->documentPath() << mDoc->error();
        emit documentFailed( mDoc->error() );
    }

    emit stateChanged();
}


QTermDocument *QTermRenderer::document() const {
    return mDoc;
}


void QTermRenderer::setSink( QTermSink *sink ) {
    if ( mSink == sink ) {
        return;
    }

    mSink         = sink;
    mTextOnScreen = false;

    markDirty( ForcedRedraw );
}


QTermSink *QTermRenderer::sink() const {
    return mSink;
}


QTermViewerOptions QTermRenderer::options() const {
    return mOpts;
}


QTermPageCache *QTermRenderer::cache() const {
    return mCache;
}


QTermTextEngine *QTermRenderer::textEngine() const {
    return mText;
}


int QTermRenderer::currentPage() const {
    return mPage;
}


int QTermRenderer::pageCount() const {
    return mPageCount;
}


bool QTermRenderer::canGoToPreviousPage() const {
    return mPage > 0;
}


bool QTermRenderer::canGoToNextPage() const {
    return mPage < mPageCount - 1;
}


QTermViewerOptions::ViewMode QTermRenderer::viewMode() const {
    return mViewMode;
}


QTermTextEngine::TextMode QTermRenderer::textMode() const {
    return mTextMode;
}


QTermViewportState QTermRenderer::viewport() const {
    return mViewport;
}


QSize QTermRenderer::cellSize() const {
    return mCellSize;
}


int QTermRenderer::textScroll() const {
    return mTextScroll;
}


int QTermRenderer::textLineCount() const {
    return mTextLines;
}


bool QTermRenderer::isDirty() const {
    if ( mForced != NotDirty or not mHasCommitted ) {
        return true;
    }

    return current() != mCommitted;
}


QTermRenderer::DirtyReasons QTermRenderer::dirtyReasons() const {
    DirtyReasons reasons = mForced;

    if ( not mHasCommitted ) {
        return reasons | DocumentChanged;
    }

    const Snapshot now = current();

    if ( now.page != mCommitted.page ) {
        reasons |= PageChanged;
    }

    if ( (now.viewMode != mCommitted.viewMode) or (now.textMode != mCommitted.textMode) ) {
        reasons |= ModeChanged;
    }

    if ( (now.viewport.zoomPercent != mCommitted.viewport.zoomPercent) or (now.viewport.panX != mCommitted.viewport.panX) or
         (now.viewport.panY != mCommitted.viewport.panY) or (now.textScroll != mCommitted.textScroll) ) {
        reasons |= ViewportChanged;
    }

    if ( (now.viewport.frameCols != mCommitted.viewport.frameCols) or (now.viewport.frameRows != mCommitted.viewport.frameRows) or
         (now.cellSize != mCommitted.cellSize) ) {
        reasons |= FrameResized;
    }

    if ( now.generation != mCommitted.generation ) {
        reasons |= DocumentChanged;
    }

    return reasons;
}


bool QTermRenderer::isPageFailed() const {
    if ( not mDoc or (mDoc->status() != QTermDocument::Ready) ) {
        return false;
    }

    return mFailed.contains( currentKey() );
}


QTermFrameTimings QTermRenderer::lastTimings() const {
    return mTimings;
}


int QTermRenderer::droppedResults() const {
    return mDropped;
}


int QTermRenderer::framesProduced() const {
    return mFrames;
}


void QTermRenderer::setPage( int page ) {
    if ( (page < 0) or (page >= mPageCount) or (page == mPage) ) {
        return;
    }

    mPage = page;
    pageChanged( mPage );

    emit currentPageChanged( mPage );
}


void QTermRenderer::nextPage() {
    setPage( mPage + 1 );
}


void QTermRenderer::previousPage() {
    setPage( mPage - 1 );
}


void QTermRenderer::firstPage() {
    setPage( 0 );
}


void QTermRenderer::lastPage() {
    setPage( mPageCount - 1 );
}


void QTermRenderer::zoomIn() {
    setZoom( mViewport.zoomPercent + mOpts.limits.zoomStep );
}


void QTermRenderer::zoomOut() {
    setZoom( mViewport.zoomPercent - mOpts.limits.zoomStep );
}


void QTermRenderer::setZoom( int percent ) {
    const int zoom = QTermViewport::clampZoom( percent, mOpts.limits );

    if ( zoom == mViewport.zoomPercent ) {
        return;
    }

    /** A new zoom starts from the top left corner */
    mViewport.zoomPercent = zoom;
    mViewport.panX        = 0;
    mViewport.panY        = 0;

    emit stateChanged();
}


void QTermRenderer::resetView() {
    mViewport.zoomPercent = 100;
    mViewport.panX        = 0;
    mViewport.panY        = 0;

    markDirty( ViewportChanged );

    emit stateChanged();
}


void QTermRenderer::panBy( int dCols, int dRows ) {
    int panX = mViewport.panX + dCols * mCellSize.width();
    int panY = mViewport.panY + dRows * mCellSize.height();

    panX = qMax( 0, panX );
    panY = qMax( 0, panY );

    /** The bitmap size follows from the request: clamp without rendering */
    if ( mDoc and (mDoc->status() == QTermDocument::Ready) ) {
        QTermViewportState state = mViewport;

        state.panX = panX;
        state.panY = panY;

        const QTermRenderRequest req = QTermViewport::renderRequest(
            mPage, mDoc->pageSize( mPage ), state, mCellSize, mOpts.limits, mOpts.colorMode
        );

        QTermViewport::place( QSize( req.width, req.height ), state, mCellSize, mOpts.limits.maxTransmitPixels );

        panX = state.panX;
        panY = state.panY;
    }

    if ( (panX == mViewport.panX) and (panY == mViewport.panY) ) {
        return;
    }

    mViewport.panX = panX;
    mViewport.panY = panY;

    emit stateChanged();
}


void QTermRenderer::pageDown() {
    const int rows = qMax( 1, mViewport.frameRows - 2 );

    if ( mViewMode == QTermViewerOptions::TextView ) {
        scrollText( rows );
    }

    else {
        panBy( 0, rows );
    }
}


void QTermRenderer::pageUp() {
    const int rows = qMax( 1, mViewport.frameRows - 2 );

    if ( mViewMode == QTermViewerOptions::TextView ) {
        scrollText( -rows );
    }

    else {
        panBy( 0, -rows );
    }
}


void QTermRenderer::setViewMode( QTermViewerOptions::ViewMode mode ) {
    if ( mode == mViewMode ) {
        return;
    }

    mViewMode = mode;

    emit stateChanged();
}


void QTermRenderer::toggleViewMode() {
    setViewMode( mViewMode == QTermViewerOptions::ImageView ? QTermViewerOptions::TextView : QTermViewerOptions::ImageView );
}


void QTermRenderer::setTextMode( QTermTextEngine::TextMode mode ) {
    if ( mode == mTextMode ) {
        return;
    }

    mTextMode   = mode;
    mTextScroll = 0;

    emit stateChanged();
}


void QTermRenderer::cycleTextMode() {
    switch ( mTextMode ) {
        case QTermTextEngine::Raw: {
            setTextMode( QTermTextEngine::Wrap );
            break;
        }

        case QTermTextEngine::Wrap: {
            setTextMode( QTermTextEngine::Reflow );
            break;
        }

        case QTermTextEngine::Reflow: {
            setTextMode( QTermTextEngine::Raw );
            break;
        }
    }
}


void QTermRenderer::scrollText( int lines ) {
    const int maxScroll = qMax( 0, mTextLines - mViewport.frameRows );
    const int scroll    = qBound( 0, mTextScroll + lines, maxScroll );

    if ( scroll == mTextScroll ) {
        return;
    }

    mTextScroll = scroll;

    emit stateChanged();
}


void QTermRenderer::setFrameSize( int cols, int rows ) {
    cols = qMax( 1, cols );
    rows = qMax( 1, rows );

    if ( (cols == mViewport.frameCols) and (rows == mViewport.frameRows) ) {
        return;
    }

    mViewport.frameCols = cols;
    mViewport.frameRows = rows;

    /** The screen was cleared by the terminal or by us */
    mTextOnScreen = true;

    emit stateChanged();
}


void QTermRenderer::setCellSize( QSize cellPx ) {
    if ( not cellPx.isValid() or cellPx.isEmpty() or (cellPx == mCellSize) ) {
        return;
    }

    mCellSize = cellPx;

    emit stateChanged();
}


void QTermRenderer::markDirty( QTermRenderer::DirtyReason reason ) {
    mForced |= reason;
}


bool QTermRenderer::renderFrame() {
    if ( not isDirty() ) {
        return false;
    }

    if ( not mSink ) {
        qWarning() << "No sink to render into";
        return false;
    }

    /** Stay dirty: the frame is produced once the document is ready */
    if ( not mDoc or (mDoc->status() != QTermDocument::Ready) ) {
        return false;
    }

    if ( mViewMode == QTermViewerOptions::TextView ) {
        return renderText();
    }

    return renderImage();
}


void QTermRenderer::handleImage( QTermCacheKey key, QImage image, qint64 elapsedMs ) {
    mRendering.remove( key );

    const bool current = mDoc and (mDoc->status() == QTermDocument::Ready) and (mViewMode == QTermViewerOptions::ImageView) and
                         (key == currentKey() );

    if ( not current ) {
        mDropped++;
        qDebug() << "Dropping stale render of page" << key.request.page << "at" << key.request.width << "x" << key.request.height;

        return;
    }

    if ( image.isNull() ) {
        mFailed << key;

        qWarning() << "Page" << key.request.page + 1 << "could not be rendered";
        emit pageFailed( key.request.page );
    }

    else {
        mDelivered.key    = key;
        mDelivered.pixels = image;
        mDeliveredMs      = elapsedMs;
    }

    markDirty( ResultArrived );
    emit frameReady();
}


void QTermRenderer::handleText( int page, quint64 generation ) {
    mStructuring.remove( page );

    if ( not mDoc or (generation != mDoc->generation() ) or (page != mPage ) ) {
        mDropped++;
        qDebug() << "Dropping stale text of page" << page;

        return;
    }

    markDirty( ResultArrived );
    emit frameReady();
}


void QTermRenderer::syncPages() {
    const bool ready = mDoc and (mDoc->status() == QTermDocument::Ready);
    const int  count = (ready ? mDoc->pageCount() : 0);

    if ( count != mPageCount ) {
        mPageCount = count;
        emit pageCountChanged( mPageCount );
    }

    /** A reload keeps the page if it still exists, otherwise the last one */
    const int page = qBound( 0, mPage, qMax( 0, mPageCount - 1 ) );

    if ( page != mPage ) {
        mPage = page;
        pageChanged( mPage );
        emit currentPageChanged( mPage );
    }
}


void QTermRenderer::pageChanged( int page ) {
    mViewport.panX = 0;
    mViewport.panY = 0;
    mTextScroll    = 0;
    mTextLines     = 0;

    /** Coming back to a page is the only retry a failed page gets */
    for ( auto it = mFailed.begin(); it != mFailed.end(); ) {
        if ( it->request.page == page ) {
            it = mFailed.erase( it );
        }

        else {
            ++it;
        }
    }

    emit stateChanged();
}


void QTermRenderer::handleDocumentStatus( QTermDocument::Status status ) {
    switch ( status ) {
        case QTermDocument::Ready: {
            syncPages();
            markDirty( DocumentChanged );
            break;
        }

        case QTermDocument::Failed: {
            syncPages();
            qCritical() << "Unable to open" << mDoc->documentPath() << mDoc->error();
            emit documentFailed( mDoc->error() );
            break;
        }

        default: {
            break;
        }
    }

    emit stateChanged();
}


void QTermRenderer::handleDocumentReloading() {
    /** Workers may be inside the pages that are about to be closed */
    mPool->waitForDone();
}


void QTermRenderer::handleDocumentReloaded() {
    const quint64 generation = mDoc->generation();

    qDebug() << "Document reloaded, generation" << generation;

    mCache->invalidateBefore( generation );
    mText->invalidate();

    mFailed.clear();
    mDelivered  = QTermCachedBitmap();
    mSent       = QImage();
    mSentSource = 0;

    markDirty( DocumentChanged );
    emit frameReady();
}


QTermRenderer::Snapshot QTermRenderer::current() const {
    Snapshot snap;

    snap.page       = mPage;
    snap.viewMode   = mViewMode;
    snap.textMode   = mTextMode;
    snap.viewport   = mViewport;
    snap.cellSize   = mCellSize;
    snap.textScroll = mTextScroll;
    snap.generation = (mDoc ? mDoc->generation() : 0);

    return snap;
}


void QTermRenderer::commit() {
    mCommitted    = current();
    mHasCommitted = true;
    mForced       = NotDirty;

    mFrames++;

    emit frameRendered( mCommitted.page );
}


QTermCacheKey QTermRenderer::currentKey() const {
    QTermCacheKey key;

    const int page = mPage;

    key.generation = mDoc->generation();
    key.request    = QTermViewport::renderRequest( page, mDoc->pageSize( page ), mViewport, mCellSize, mOpts.limits, mOpts.colorMode );

    return key;
}


bool QTermRenderer::renderImage() {
    const QTermCacheKey key = currentKey();

    if ( mFailed.contains( key ) ) {
        return renderFailure();
    }

    QTermCachedBitmap bmp;
    qint64            rasterMs = -1;

    if ( (mDelivered.key == key) and not mDelivered.isNull() ) {
        bmp      = mDelivered;
        rasterMs = mDeliveredMs;
    }

    else {
        bmp = mCache->lookup( key );
    }

    if ( bmp.isNull() ) {
        if ( not mOpts.synchronous ) {
            dispatchRender( key );
            return false;
        }

        QElapsedTimer raster;
        raster.start();

        bmp      = RenderTask::render( mDoc, mCache, key, renderOptions() );
        rasterMs = raster.elapsed();

        if ( bmp.isNull() ) {
            mFailed << key;

            qWarning() << "Page" << key.request.page + 1 << "could not be rendered";
            emit pageFailed( key.request.page );

            return renderFailure();
        }
    }

    /** The view lives for this frame only */
    mDelivered = QTermCachedBitmap();

    mTimings             = QTermFrameTimings();
    mTimings.rasterizeMs = rasterMs;

    QElapsedTimer timer;
    timer.start();

    const QTermPlacement placement = QTermViewport::place( bmp.pixels.size(), mViewport, mCellSize, mOpts.limits.maxTransmitPixels );

    mTimings.viewportMs = timer.restart();

    const QImage buffer = transmitBuffer( bmp, placement );

    mTimings.downscaleMs = timer.restart();

    /** Text from the previous frame would show around the image */
    if ( mTextOnScreen ) {
        mSink->emitText( QStringList(), mViewport.frameCols, mViewport.frameRows );
        mTextOnScreen = false;
    }

    mSink->emitImage( buffer, placement );

    mTimings.protocolMs = timer.elapsed();

    qDebug().noquote() << QString( "Page %1: raster %2 ms, viewport %3 ms, downscale %4 ms, protocol %5 ms, %6x%7 -> %8x%9" )
        .arg( key.request.page + 1 )
        .arg( mTimings.rasterizeMs ).arg( mTimings.viewportMs ).arg( mTimings.downscaleMs ).arg( mTimings.protocolMs )
        .arg( placement.cropRect.width() ).arg( placement.cropRect.height() )
        .arg( placement.transmitSize.width() ).arg( placement.transmitSize.height() );

    commit();

    return true;
}


bool QTermRenderer::renderText() {
    QTermTextPage textPage;

    if ( not currentText( textPage ) ) {
        return false;
    }

    const int cols = mViewport.frameCols;
    const int rows = mViewport.frameRows;

    mSink->clear();

    if ( textPage.status == QTermTextPage::NoExtractableText ) {
        mTextLines  = 0;
        mTextScroll = 0;

        mSink->emitPlaceholder( textPage.reason + " (m: image mode)", cols, rows );
    }

    else {
        const QStringList lines = QTermTextEngine::layout( textPage, mTextMode, cols );

        mTextLines  = lines.count();
        mTextScroll = qBound( 0, mTextScroll, qMax( 0, mTextLines - rows ) );

        mSink->emitText( lines.mid( mTextScroll, rows ), cols, rows );
    }

    mTextOnScreen = true;

    commit();

    return true;
}


bool QTermRenderer::renderFailure() {
    const int cols = mViewport.frameCols;
    const int rows = mViewport.frameRows;

    const QString label = QString( "Page %1 could not be rendered" ).arg( mPage + 1 );

    QStringList lines = QTermSink::placeholder( cols, qMin( rows, 5 ), label );

    /** Whatever text the page has goes under the label */
    QTermTextPage textPage;

    if ( currentText( textPage ) and (textPage.status == QTermTextPage::Ok) ) {
        lines << QString();
        lines << QTermTextEngine::layout( textPage, mTextMode, cols );
    }

    mSink->clear();
    mSink->emitText( lines.mid( 0, rows ), cols, rows );

    mTextOnScreen = true;

    commit();

    return true;
}


bool QTermRenderer::currentText( QTermTextPage& textPage ) {
    const int page = mPage;

    if ( mOpts.synchronous or mText->isCached( page ) ) {
        textPage = mText->textPage( page );
        return true;
    }

    dispatchText( page );

    return false;
}


void QTermRenderer::dispatchRender( const QTermCacheKey& key ) {
    if ( mRendering.contains( key ) ) {
        return;
    }

    mRendering << key;

    qDebug() << "Rendering page" << key.request.page << "at" << key.request.width << "x" << key.request.height;

    RenderTask *task = new RenderTask( mDoc, mCache, key, renderOptions() );

    connect( task, &RenderTask::imageReady, this, &QTermRenderer::handleImage, Qt::QueuedConnection );
    mPool->start( task );
}


void QTermRenderer::dispatchText( int page ) {
    if ( mStructuring.contains( page ) ) {
        return;
    }

    mStructuring << page;

    TextTask *task = new TextTask( mText, page, mDoc->generation() );

    connect( task, &TextTask::textReady, this, &QTermRenderer::handleText, Qt::QueuedConnection );
    mPool->start( task );
}


QImage QTermRenderer::transmitBuffer( const QTermCachedBitmap& bitmap, const QTermPlacement& placement ) {
    if ( placement.cropRect.isEmpty() ) {
        return QImage();
    }

    const bool cropped = (placement.cropRect != QRect( QPoint( 0, 0 ), bitmap.pixels.size() ) );

    /** Whole bitmap: hand out the cached pixels themselves */
    if ( not cropped and not placement.isDownscaled() ) {
        mSent       = QImage();
        mSentSource = 0;

        return bitmap.pixels;
    }

    /** Same source and geometry as last time: same buffer, so the sink can skip the upload */
    if ( not mSent.isNull() and (mSentSource == bitmap.pixels.cacheKey() ) and (mSentPlacement.cropRect == placement.cropRect) and
         (mSentPlacement.transmitSize == placement.transmitSize) ) {
        return mSent;
    }

    QImage buffer = (cropped ? bitmap.pixels.copy( placement.cropRect ) : bitmap.pixels);

    if ( placement.isDownscaled() ) {
        buffer = buffer.scaled( placement.transmitSize, Qt::IgnoreAspectRatio, Qt::SmoothTransformation );
    }

    mSent          = buffer;
    mSentSource    = bitmap.pixels.cacheKey();
    mSentPlacement = placement;

    return buffer;
}


QTermRenderOptions QTermRenderer::renderOptions() const {
    QTermRenderOptions opts;

    opts.setColorMode( mOpts.colorMode );

    return opts;
}
